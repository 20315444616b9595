#include "app/MainWindow.h"
#include "common/Settings.h"
#include "common/log.h"
#include "common/logging.h"
#include "io/SourceReader.h"

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QStringList>
#include <QtGui/QPalette>
#include <QtGui/QSurfaceFormat>
#include <QtWidgets/QApplication>

namespace
{

QPalette buildDarkPalette()
{
    QPalette palette;
    palette.setColor(QPalette::Window, QColor(18, 18, 20));
    palette.setColor(QPalette::WindowText, Qt::white);
    palette.setColor(QPalette::Base, QColor(30, 30, 34));
    palette.setColor(QPalette::AlternateBase, QColor(45, 45, 50));
    palette.setColor(QPalette::ToolTipBase, Qt::white);
    palette.setColor(QPalette::ToolTipText, Qt::white);
    palette.setColor(QPalette::Text, Qt::white);
    palette.setColor(QPalette::Button, QColor(45, 45, 50));
    palette.setColor(QPalette::ButtonText, Qt::white);
    palette.setColor(QPalette::BrightText, Qt::red);
    palette.setColor(QPalette::Highlight, QColor(64, 128, 255));
    palette.setColor(QPalette::HighlightedText, Qt::black);
    palette.setColor(QPalette::PlaceholderText, QColor(180, 180, 180));

    palette.setColor(QPalette::Disabled, QPalette::Text, QColor(110, 110, 110));
    palette.setColor(QPalette::Disabled, QPalette::ButtonText, QColor(110, 110, 110));
    return palette;
}

void setDefaultSurfaceFormat()
{
    QSurfaceFormat format;
    format.setVersion(3, 3);
    format.setProfile(QSurfaceFormat::CoreProfile);
    format.setDepthBufferSize(24);
    format.setSamples(4);
    QSurfaceFormat::setDefaultFormat(format);
}

} // namespace

int main(int argc, char* argv[])
{
    setDefaultSurfaceFormat();

    QApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("CncPathVisualizer"));
    app.setOrganizationName(QStringLiteral("CncPathVisualizer"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QApplication::setStyle(QStringLiteral("Fusion"));
    app.setPalette(buildDarkPalette());

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Shows a part mesh together with the tool path of a G-code program."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("model"), QStringLiteral("Part mesh (.stl). Defaults to the configured part."), QStringLiteral("[model.stl]"));
    parser.addPositionalArgument(QStringLiteral("program"), QStringLiteral("G-code program (.gcode). Defaults to the configured program."), QStringLiteral("[program.gcode]"));
    const QCommandLineOption durationOption(QStringList{QStringLiteral("d"), QStringLiteral("duration")},
                                            QStringLiteral("Playback duration in milliseconds."),
                                            QStringLiteral("ms"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Enable debug logging."));
    parser.addOption(durationOption);
    parser.addOption(verboseOption);
    parser.process(app);

    common::initLogging(parser.isSet(verboseOption));

    common::Settings settings = common::Settings::loadUserSettings();
    if (parser.isSet(durationOption))
    {
        bool ok = false;
        const double durationMs = parser.value(durationOption).toDouble(&ok);
        if (ok && durationMs > 0.0)
        {
            settings.playback.durationMs = durationMs;
        }
        else
        {
            LOG_WARN(App, QStringLiteral("Ignoring invalid --duration value '%1'.").arg(parser.value(durationOption)));
        }
    }

    const io::CommandLineSources sources = io::sortCommandLineSources(parser.positionalArguments());
    for (const QString& rejected : sources.rejected)
    {
        LOG_WARN(App, QStringLiteral("Ignoring command-line file '%1': expected one .stl and one .gcode file.").arg(rejected));
    }

    LOG_INFO(App, QStringLiteral("Application started (settings: %1).").arg(common::userSettingsFilePath()));

    app::MainWindow window(settings);
    window.show();
    window.loadInitialAssets(sources.modelPath, sources.programPath);

    return QApplication::exec();
}
