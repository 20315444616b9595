#pragma once

#include "common/Settings.h"
#include "io/LoadError.h"

#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QThread>

#include <memory>

namespace render
{
class Model;
}

namespace io
{

// Reads and decodes one part file off the GUI thread. Runs to completion even
// when a newer load supersedes it; the receiver decides whether to keep the result.
class MeshLoadWorker : public QThread
{
    Q_OBJECT

public:
    MeshLoadWorker(QString filePath,
                   QString defaultPath,
                   common::MeshSettings placement,
                   QObject* parent = nullptr);

Q_SIGNALS:
    void loaded(std::shared_ptr<render::Model> model);
    void failed(const io::LoadError& error);

protected:
    void run() override;

private:
    QString m_filePath;
    QString m_defaultPath;
    common::MeshSettings m_placement;
};

} // namespace io

Q_DECLARE_METATYPE(std::shared_ptr<render::Model>)
