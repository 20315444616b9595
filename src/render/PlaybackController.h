#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QObject>

#include <optional>

namespace render
{

// Time-based traversal of the loaded path. Driven by the render loop through
// tick(); progress is the visible fraction of the path in [0, 1].
class PlaybackController : public QObject
{
    Q_OBJECT

public:
    enum class State
    {
        Idle,
        Playing,
        Paused,
        Completed
    };
    Q_ENUM(State)

    static constexpr double kDefaultDurationMs = 5'000.0;

    explicit PlaybackController(QObject* parent = nullptr);

    // Takes effect at the next resetForPath() so one loaded path keeps one duration.
    void setDuration(double durationMs);
    [[nodiscard]] double duration() const noexcept { return m_durationMs; }

    void resetForPath();

    void play();
    void pause();
    void reset();
    void seek(double normalized);

    // Returns true while further ticks are wanted.
    bool tick(double nowMs);

    [[nodiscard]] double progress() const noexcept { return m_progress; }
    [[nodiscard]] State state() const noexcept { return m_state; }
    [[nodiscard]] bool wantsTicks() const noexcept { return m_state == State::Playing; }

Q_SIGNALS:
    void progressChanged(double normalized);
    void stateChanged(render::PlaybackController::State state);

private:
    void setState(State state);
    void setProgressValue(double value);

    double m_progress{0.0};
    State m_state{State::Idle};
    std::optional<double> m_lastTickMs;
    double m_durationMs{kDefaultDurationMs};
    double m_pendingDurationMs{kDefaultDurationMs};
};

const char* playbackStateName(PlaybackController::State state);

} // namespace render

Q_DECLARE_METATYPE(render::PlaybackController::State)
