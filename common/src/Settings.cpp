#include "common/Settings.h"

#include "common/log.h"

#include <QtCore/QDir>
#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>

namespace common
{

namespace
{
constexpr int kMinFrameIntervalMs = 1;
constexpr int kMaxFrameIntervalMs = 1'000;
}

Settings Settings::load(QSettings& store)
{
    Settings settings;

    const double duration = store.value(QStringLiteral("playback/durationMs"), settings.playback.durationMs).toDouble();
    if (duration > 0.0)
    {
        settings.playback.durationMs = duration;
    }
    else
    {
        LOG_WARN(App, QStringLiteral("Ignoring non-positive playback/durationMs (%1).").arg(duration));
    }

    const int interval = store.value(QStringLiteral("playback/frameIntervalMs"), settings.playback.frameIntervalMs).toInt();
    if (interval >= kMinFrameIntervalMs && interval <= kMaxFrameIntervalMs)
    {
        settings.playback.frameIntervalMs = interval;
    }

    settings.path.fallbackEnabled = store.value(QStringLiteral("path/fallbackEnabled"), settings.path.fallbackEnabled).toBool();
    const double fallbackLength = store.value(QStringLiteral("path/fallbackLength"), settings.path.fallbackLength).toDouble();
    if (fallbackLength > 0.0)
    {
        settings.path.fallbackLength = fallbackLength;
    }

    settings.mesh.centerOnOrigin = store.value(QStringLiteral("mesh/centerOnOrigin"), settings.mesh.centerOnOrigin).toBool();
    settings.mesh.upAxis = upAxisFromString(store.value(QStringLiteral("mesh/upAxis")).toString(), settings.mesh.upAxis);
    const double scale = store.value(QStringLiteral("mesh/scale"), settings.mesh.scale).toDouble();
    if (scale > 0.0)
    {
        settings.mesh.scale = scale;
    }

    settings.assets.defaultModelPath = store.value(QStringLiteral("assets/defaultModel")).toString().trimmed();
    settings.assets.defaultProgramPath = store.value(QStringLiteral("assets/defaultProgram")).toString().trimmed();

    return settings;
}

Settings Settings::loadUserSettings()
{
    QSettings store(userSettingsFilePath(), QSettings::IniFormat);
    store.setFallbacksEnabled(false);
    return load(store);
}

QString userSettingsFilePath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (base.isEmpty())
    {
        base = QDir::homePath() + QStringLiteral("/.cncviz");
    }
    return QDir(base).filePath(QStringLiteral("cncviz.cfg"));
}

UpAxis upAxisFromString(const QString& text, UpAxis fallback)
{
    const QString key = text.trimmed().toLower();
    if (key == QStringLiteral("z"))
    {
        return UpAxis::Z;
    }
    if (key == QStringLiteral("y"))
    {
        return UpAxis::Y;
    }
    return fallback;
}

} // namespace common
