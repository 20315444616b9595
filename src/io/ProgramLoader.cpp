#include "io/ProgramLoader.h"

#include "common/log.h"
#include "gcode/DefaultProgram.h"
#include "gcode/Interpreter.h"
#include "io/SourceReader.h"

#include <QtCore/QByteArray>
#include <QtCore/QFileInfo>

namespace io
{

namespace
{
constexpr qint64 kMaxProgramBytes = 512 * 1024ll * 1024ll;
}

ProgramLoader::ProgramLoader(gcode::PathBuildOptions options)
    : m_options(options)
{
}

bool ProgramLoader::loadSource(const QString& path,
                               const QString& configuredDefault,
                               gcode::PathBuildResult& out,
                               LoadError& error) const
{
    if (!path.isEmpty())
    {
        return load(path, out, error);
    }
    if (!configuredDefault.isEmpty())
    {
        return load(configuredDefault, out, error);
    }

    out = build(gcode::kDefaultProgram);
    return true;
}

bool ProgramLoader::load(const QString& path, gcode::PathBuildResult& out, LoadError& error) const
{
    QByteArray bytes;
    if (!readSourceBytes(path, kMaxProgramBytes, true, bytes, error))
    {
        return false;
    }

    if (!looksLikeText(bytes))
    {
        error = {LoadErrorKind::SourceRead, QStringLiteral("%1 is not a text file.").arg(QFileInfo(path).fileName())};
        return false;
    }

    out = build(std::string_view(bytes.constData(), static_cast<std::size_t>(bytes.size())));
    return true;
}

gcode::PathBuildResult ProgramLoader::build(std::string_view text) const
{
    gcode::Interpreter interpreter;
    const std::vector<gcode::MotionCommand> commands = interpreter.interpret(text);

    const gcode::PathBuilder builder(m_options);
    gcode::PathBuildResult result = builder.build(commands);

    LOG_INFO(Gcode, QStringLiteral("Built path: %1 commands, %2 vertices (%3).")
                        .arg(commands.size())
                        .arg(result.vertices.size())
                        .arg(QString::fromLatin1(gcode::pathStatusName(result.status))));
    return result;
}

} // namespace io
