#include "io/PathLoadWorker.h"

#include "io/ProgramLoader.h"

#include <exception>
#include <utility>

namespace io
{

PathLoadWorker::PathLoadWorker(QString filePath,
                               QString defaultPath,
                               gcode::PathBuildOptions options,
                               QObject* parent)
    : QThread(parent)
    , m_filePath(std::move(filePath))
    , m_defaultPath(std::move(defaultPath))
    , m_options(options)
{
    qRegisterMetaType<std::shared_ptr<gcode::PathBuildResult>>("std::shared_ptr<gcode::PathBuildResult>");
    qRegisterMetaType<io::LoadError>("io::LoadError");
}

void PathLoadWorker::run()
{
    const ProgramLoader loader(m_options);
    auto result = std::make_shared<gcode::PathBuildResult>();
    LoadError error;

    bool ok = false;
    try
    {
        ok = loader.loadSource(m_filePath, m_defaultPath, *result, error);
    }
    catch (const std::exception& ex)
    {
        error = {LoadErrorKind::SourceRead, QString::fromUtf8(ex.what())};
    }

    if (!ok)
    {
        Q_EMIT failed(error);
        return;
    }

    Q_EMIT loaded(std::move(result));
}

} // namespace io
