#pragma once

#include "gcode/PathBuilder.h"
#include "io/LoadError.h"

#include <QtCore/QString>

#include <string_view>

namespace io
{

// Reads G-code text and turns it into the flattened vertex sequence.
class ProgramLoader
{
public:
    ProgramLoader() = default;
    explicit ProgramLoader(gcode::PathBuildOptions options);

    // An empty path selects configuredDefault, or the embedded program when that is empty too.
    bool loadSource(const QString& path,
                    const QString& configuredDefault,
                    gcode::PathBuildResult& out,
                    LoadError& error) const;

    bool load(const QString& path, gcode::PathBuildResult& out, LoadError& error) const;

    [[nodiscard]] gcode::PathBuildResult build(std::string_view text) const;

private:
    gcode::PathBuildOptions m_options;
};

} // namespace io
