#pragma once

#include <QtCore/QString>

class QSettings;

namespace common
{

enum class UpAxis
{
    Z,
    Y
};

struct PlaybackSettings
{
    double durationMs{5'000.0};
    int frameIntervalMs{16};
};

struct PathSettings
{
    bool fallbackEnabled{true};
    double fallbackLength{1.0};
};

struct MeshSettings
{
    bool centerOnOrigin{false};
    UpAxis upAxis{UpAxis::Z};
    double scale{1.0};
};

struct AssetSettings
{
    QString defaultModelPath;   // empty selects the embedded part
    QString defaultProgramPath; // empty selects the embedded program
};

struct Settings
{
    PlaybackSettings playback;
    PathSettings path;
    MeshSettings mesh;
    AssetSettings assets;

    // Reads every key, keeping the defaults above for keys that are missing or out of range.
    static Settings load(QSettings& store);
    static Settings loadUserSettings();
};

QString userSettingsFilePath();

UpAxis upAxisFromString(const QString& text, UpAxis fallback = UpAxis::Z);

} // namespace common
