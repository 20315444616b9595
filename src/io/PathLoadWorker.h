#pragma once

#include "gcode/PathBuilder.h"
#include "io/LoadError.h"

#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QThread>

#include <memory>

namespace io
{

// Reads, interprets and builds one G-code program off the GUI thread.
class PathLoadWorker : public QThread
{
    Q_OBJECT

public:
    PathLoadWorker(QString filePath,
                   QString defaultPath,
                   gcode::PathBuildOptions options,
                   QObject* parent = nullptr);

Q_SIGNALS:
    void loaded(std::shared_ptr<gcode::PathBuildResult> path);
    void failed(const io::LoadError& error);

protected:
    void run() override;

private:
    QString m_filePath;
    QString m_defaultPath;
    gcode::PathBuildOptions m_options;
};

} // namespace io

Q_DECLARE_METATYPE(std::shared_ptr<gcode::PathBuildResult>)
