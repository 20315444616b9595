#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QString>

namespace io
{

enum class LoadErrorKind
{
    SourceRead, // file missing, unreadable or empty
    Decode      // bytes rejected by the mesh decoder
};

struct LoadError
{
    LoadErrorKind kind{LoadErrorKind::SourceRead};
    QString message;

    [[nodiscard]] QString describe() const
    {
        const QString prefix = kind == LoadErrorKind::SourceRead ? QStringLiteral("Failed to read file")
                                                                 : QStringLiteral("Failed to decode file");
        return message.isEmpty() ? prefix : QStringLiteral("%1: %2").arg(prefix, message);
    }
};

} // namespace io

Q_DECLARE_METATYPE(io::LoadError)
