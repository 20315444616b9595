#include "common/logging.h"

#include <QtCore/QDateTime>
#include <QtCore/QLoggingCategory>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QTextStream>

#include <cstdlib>

namespace common
{

namespace
{

QMutex& outputMutex()
{
    static QMutex mutex;
    return mutex;
}

void outputMessage(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    QString level;
    switch (type)
    {
    case QtDebugMsg: level = QStringLiteral("DEBUG"); break;
    case QtInfoMsg: level = QStringLiteral("INFO"); break;
    case QtWarningMsg: level = QStringLiteral("WARN"); break;
    case QtCriticalMsg: level = QStringLiteral("CRITICAL"); break;
    case QtFatalMsg: level = QStringLiteral("FATAL"); break;
    }

    const QString category = context.category ? QString::fromLatin1(context.category) : QStringLiteral("default");

    {
        QMutexLocker lock(&outputMutex());
        QTextStream stream(stderr);
        stream << '[' << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << "] "
               << level << " [" << category << "] " << message << Qt::endl;
    }

    if (type == QtFatalMsg)
    {
        std::abort();
    }
}

} // namespace

void initLogging(bool verbose)
{
    qInstallMessageHandler(outputMessage);
    QLoggingCategory::setFilterRules(verbose ? QStringLiteral("cncviz.*.debug=true")
                                             : QStringLiteral("cncviz.*.debug=false"));
}

} // namespace common
