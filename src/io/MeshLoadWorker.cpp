#include "io/MeshLoadWorker.h"

#include "io/ModelImporter.h"
#include "render/Model.h"

#include <QtCore/QMetaType>

#include <exception>
#include <utility>

namespace io
{

MeshLoadWorker::MeshLoadWorker(QString filePath,
                               QString defaultPath,
                               common::MeshSettings placement,
                               QObject* parent)
    : QThread(parent)
    , m_filePath(std::move(filePath))
    , m_defaultPath(std::move(defaultPath))
    , m_placement(placement)
{
    qRegisterMetaType<std::shared_ptr<render::Model>>("std::shared_ptr<render::Model>");
    qRegisterMetaType<io::LoadError>("io::LoadError");
}

void MeshLoadWorker::run()
{
    const ModelImporter importer(m_placement);
    auto model = std::make_shared<render::Model>();
    LoadError error;

    bool ok = false;
    try
    {
        ok = importer.loadSource(m_filePath, m_defaultPath, *model, error);
    }
    catch (const std::exception& ex)
    {
        error = {LoadErrorKind::Decode, QString::fromUtf8(ex.what())};
    }

    if (!ok)
    {
        Q_EMIT failed(error);
        return;
    }

    Q_EMIT loaded(std::move(model));
}

} // namespace io
