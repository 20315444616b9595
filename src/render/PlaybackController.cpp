#include "render/PlaybackController.h"

#include "common/log.h"

#include <QtCore/QString>

#include <algorithm>
#include <cmath>

namespace render
{

PlaybackController::PlaybackController(QObject* parent)
    : QObject(parent)
{
}

void PlaybackController::setDuration(double durationMs)
{
    if (!(durationMs > 0.0) || !std::isfinite(durationMs))
    {
        LOG_WARN(Render, QStringLiteral("Rejected playback duration %1 ms.").arg(durationMs));
        return;
    }
    m_pendingDurationMs = durationMs;
}

void PlaybackController::resetForPath()
{
    m_durationMs = m_pendingDurationMs;
    reset();
}

void PlaybackController::play()
{
    if (m_state == State::Playing)
    {
        return;
    }

    if (m_state == State::Completed)
    {
        setProgressValue(0.0);
    }

    m_lastTickMs.reset();
    setState(State::Playing);
}

void PlaybackController::pause()
{
    if (m_state != State::Playing)
    {
        return;
    }

    m_lastTickMs.reset();
    setState(State::Paused);
}

void PlaybackController::reset()
{
    m_lastTickMs.reset();
    setProgressValue(0.0);
    setState(State::Idle);
}

void PlaybackController::seek(double normalized)
{
    const double value = std::isnan(normalized) ? 0.0 : std::clamp(normalized, 0.0, 1.0);

    m_lastTickMs.reset();
    setProgressValue(value);
    setState(value >= 1.0 ? State::Completed : State::Paused);
}

bool PlaybackController::tick(double nowMs)
{
    if (m_state != State::Playing)
    {
        return false;
    }

    // The first tick after entering Playing only anchors the clock.
    if (!m_lastTickMs)
    {
        m_lastTickMs = nowMs;
        return true;
    }

    const double delta = std::max(0.0, nowMs - *m_lastTickMs);
    m_lastTickMs = std::max(*m_lastTickMs, nowMs);

    if (delta > 0.0)
    {
        setProgressValue(std::min(1.0, m_progress + delta / m_durationMs));
    }

    if (m_progress >= 1.0)
    {
        m_lastTickMs.reset();
        setState(State::Completed);
        return false;
    }
    return true;
}

void PlaybackController::setState(State state)
{
    if (m_state == state)
    {
        return;
    }

    LOG_DEBUG(Render,
              QStringLiteral("Playback %1 -> %2 at %3.")
                  .arg(QString::fromLatin1(playbackStateName(m_state)),
                       QString::fromLatin1(playbackStateName(state)))
                  .arg(m_progress, 0, 'f', 3));
    m_state = state;
    Q_EMIT stateChanged(m_state);
}

void PlaybackController::setProgressValue(double value)
{
    if (value == m_progress)
    {
        return;
    }
    m_progress = value;
    Q_EMIT progressChanged(m_progress);
}

const char* playbackStateName(PlaybackController::State state)
{
    switch (state)
    {
    case PlaybackController::State::Idle: return "idle";
    case PlaybackController::State::Playing: return "playing";
    case PlaybackController::State::Paused: return "paused";
    case PlaybackController::State::Completed: return "completed";
    }
    return "unknown";
}

} // namespace render
