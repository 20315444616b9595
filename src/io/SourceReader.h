#pragma once

#include "io/LoadError.h"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace io
{

enum class SourceKind
{
    Model,
    Program
};

// Case-insensitive check of the file name against the accepted extension for
// the kind (.stl or .gcode).
bool hasAcceptedExtension(const QString& path, SourceKind kind);
QString acceptedExtension(SourceKind kind);
QString fileDialogFilter(SourceKind kind);

struct CommandLineSources
{
    QString modelPath;
    QString programPath;
    QStringList rejected; // wrong extension, or a second file of a kind already given
};

// Assigns command-line files to the model and program slots by extension, in
// any order.
CommandLineSources sortCommandLineSources(const QStringList& arguments);

// Reads a whole file. Missing, unreadable, oversized and (unless allowEmpty)
// empty files are reported as SourceRead errors.
bool readSourceBytes(const QString& path, qint64 maxBytes, bool allowEmpty, QByteArray& out, LoadError& error);

// Binary content (embedded NUL bytes) cannot be read as program text.
bool looksLikeText(const QByteArray& bytes);

} // namespace io
