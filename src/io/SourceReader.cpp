#include "io/SourceReader.h"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>

namespace io
{

QString acceptedExtension(SourceKind kind)
{
    return kind == SourceKind::Model ? QStringLiteral(".stl") : QStringLiteral(".gcode");
}

bool hasAcceptedExtension(const QString& path, SourceKind kind)
{
    return QFileInfo(path).fileName().endsWith(acceptedExtension(kind), Qt::CaseInsensitive);
}

QString fileDialogFilter(SourceKind kind)
{
    return kind == SourceKind::Model ? QStringLiteral("STL models (*.stl *.STL)")
                                     : QStringLiteral("G-code programs (*.gcode *.GCODE)");
}

CommandLineSources sortCommandLineSources(const QStringList& arguments)
{
    CommandLineSources sources;
    for (const QString& argument : arguments)
    {
        if (hasAcceptedExtension(argument, SourceKind::Model) && sources.modelPath.isEmpty())
        {
            sources.modelPath = argument;
        }
        else if (hasAcceptedExtension(argument, SourceKind::Program) && sources.programPath.isEmpty())
        {
            sources.programPath = argument;
        }
        else
        {
            sources.rejected.append(argument);
        }
    }
    return sources;
}

bool readSourceBytes(const QString& path, qint64 maxBytes, bool allowEmpty, QByteArray& out, LoadError& error)
{
    out.clear();

    const QFileInfo info(path);
    if (!info.exists() || !info.isFile())
    {
        error = {LoadErrorKind::SourceRead, QStringLiteral("File does not exist: %1").arg(path)};
        return false;
    }

    if (maxBytes > 0 && info.size() > maxBytes)
    {
        error = {LoadErrorKind::SourceRead,
                 QStringLiteral("File too large (%1 bytes, limit %2).").arg(info.size()).arg(maxBytes)};
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        error = {LoadErrorKind::SourceRead, file.errorString()};
        return false;
    }

    out = file.readAll();
    if (file.error() != QFileDevice::NoError)
    {
        error = {LoadErrorKind::SourceRead, file.errorString()};
        out.clear();
        return false;
    }

    if (out.isEmpty() && !allowEmpty)
    {
        error = {LoadErrorKind::SourceRead, QStringLiteral("File is empty: %1").arg(path)};
        return false;
    }

    return true;
}

bool looksLikeText(const QByteArray& bytes)
{
    return !bytes.contains('\0');
}

} // namespace io
