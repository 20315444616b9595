#include "app/MainWindow.h"

#include "app/LoadCoordinator.h"
#include "common/log.h"
#include "render/Model.h"
#include "render/ModelViewerWidget.h"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QSignalBlocker>
#include <QtGui/QAction>
#include <QtGui/QKeySequence>
#include <QtWidgets/QApplication>
#include <QtWidgets/QFileDialog>
#include <QtWidgets/QFrame>
#include <QtWidgets/QLabel>
#include <QtWidgets/QMenuBar>
#include <QtWidgets/QMessageBox>
#include <QtWidgets/QSlider>
#include <QtWidgets/QStatusBar>
#include <QtWidgets/QStyle>
#include <QtWidgets/QToolBar>

#include <cmath>
#include <utility>

namespace app
{

namespace
{

constexpr int kSliderResolution = 1000;

std::unique_ptr<QAction> makeAction(QObject* parent, const QString& text, const QKeySequence& shortcut = {})
{
    auto action = std::make_unique<QAction>(text, parent);
    if (!shortcut.isEmpty())
    {
        action->setShortcut(shortcut);
    }
    return action;
}

QString sourceLabel(const QString& path, const QString& fallback)
{
    return path.isEmpty() ? fallback : QFileInfo(path).fileName();
}

} // namespace

MainWindow::MainWindow(common::Settings settings, QWidget* parent)
    : QMainWindow(parent)
    , m_settings(std::move(settings))
    , m_resources(m_scene, m_playback)
{
    qRegisterMetaType<render::PlaybackController::State>("render::PlaybackController::State");
    qRegisterMetaType<render::Slot>("render::Slot");

    setWindowTitle(tr("CNC Path Visualizer"));
    resize(1280, 800);

    m_playback.setDuration(m_settings.playback.durationMs);
    m_loader = std::make_unique<LoadCoordinator>(m_resources, m_settings);

    m_viewer = new render::ModelViewerWidget(m_scene, m_resources, m_playback, m_settings.playback.frameIntervalMs, this);
    setCentralWidget(m_viewer);

    connect(&m_playback, &render::PlaybackController::stateChanged, this, &MainWindow::onPlaybackStateChanged);
    connect(&m_playback, &render::PlaybackController::progressChanged, this, &MainWindow::onPlaybackProgressChanged);
    connect(&m_resources, &render::ResourceLifecycleManager::loadingChanged, this, &MainWindow::onLoadingChanged);
    connect(&m_resources, &render::ResourceLifecycleManager::loadFailed, this, &MainWindow::onLoadFailed);
    connect(&m_resources, &render::ResourceLifecycleManager::modelChanged, this, &MainWindow::updateSourceLabels);
    connect(&m_resources, &render::ResourceLifecycleManager::pathChanged, this, [this]() {
        updateSourceLabels();
        onPlaybackStateChanged(m_playback.state());
        onPlaybackProgressChanged(m_playback.progress());
    });

    createActions();
    createPlaybackToolbar();
    createStatusBar();

    connect(m_viewer, &render::ModelViewerWidget::rendererInfoChanged, this,
            [this](const QString& vendor, const QString& renderer, const QString& version) {
                Q_UNUSED(vendor);
                m_gpuLabel->setText(tr("GPU: %1 (OpenGL %2)").arg(renderer, version));
            });
    connect(m_viewer, &render::ModelViewerWidget::frameStatsUpdated, this, [this](float fps) {
        m_fpsLabel->setText(tr("FPS: %1").arg(QString::number(fps, 'f', 1)));
    });

    onPlaybackStateChanged(m_playback.state());
    onPlaybackProgressChanged(m_playback.progress());
}

MainWindow::~MainWindow()
{
    m_loader->waitForWorkers();

    // The viewer frees GPU storage of attached objects while its context is current;
    // it has to go before the scene it draws.
    delete m_viewer;
    m_viewer = nullptr;

    m_resources.teardown();
}

void MainWindow::loadInitialAssets(const QString& modelPath, const QString& programPath)
{
    m_modelSource = modelPath;
    m_programSource = programPath;
    m_loader->requestModel(modelPath);
    m_loader->requestProgram(programPath);
    updateSourceLabels();
}

void MainWindow::createActions()
{
    auto* fileMenu = menuBar()->addMenu(tr("&File"));
    auto* fileToolbar = new QToolBar(tr("Files"), this);
    fileToolbar->setObjectName(QStringLiteral("FileToolbar"));
    fileToolbar->setMovable(false);
    fileToolbar->setToolButtonStyle(Qt::ToolButtonTextOnly);
    addToolBar(Qt::TopToolBarArea, fileToolbar);

    auto openModel = makeAction(this, tr("Open &Model..."), QKeySequence::Open);
    connect(openModel.get(), &QAction::triggered, this, &MainWindow::openModelFromFile);

    auto openProgram = makeAction(this, tr("Open &Program..."), QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_O));
    connect(openProgram.get(), &QAction::triggered, this, &MainWindow::openProgramFromFile);

    auto clearModel = makeAction(this, tr("Clear Model"));
    connect(clearModel.get(), &QAction::triggered, this, [this]() {
        m_modelSource.clear();
        m_loader->requestModel(QString());
    });

    auto clearProgram = makeAction(this, tr("Clear Program"));
    connect(clearProgram.get(), &QAction::triggered, this, [this]() {
        m_programSource.clear();
        m_loader->requestProgram(QString());
    });

    fileToolbar->addAction(openModel.get());
    fileToolbar->addAction(openProgram.get());
    fileToolbar->addSeparator();
    fileToolbar->addAction(clearModel.get());
    fileToolbar->addAction(clearProgram.get());

    fileMenu->addAction(openModel.release());
    fileMenu->addAction(openProgram.release());
    fileMenu->addSeparator();
    fileMenu->addAction(clearModel.release());
    fileMenu->addAction(clearProgram.release());
    fileMenu->addSeparator();

    auto exitAction = makeAction(this, tr("E&xit"), QKeySequence::Quit);
    connect(exitAction.get(), &QAction::triggered, this, &QWidget::close);
    fileMenu->addAction(exitAction.release());

    auto* viewMenu = menuBar()->addMenu(tr("&View"));
    auto resetCamera = makeAction(this, tr("&Reset Camera"), QKeySequence(Qt::CTRL | Qt::Key_R));
    connect(resetCamera.get(), &QAction::triggered, this, [this]() { m_viewer->resetCamera(); });
    viewMenu->addAction(resetCamera.release());

    auto frameScene = makeAction(this, tr("&Frame Scene"), QKeySequence(Qt::Key_F));
    connect(frameScene.get(), &QAction::triggered, this, [this]() { m_viewer->frameScene(); });
    viewMenu->addAction(frameScene.release());
}

void MainWindow::createPlaybackToolbar()
{
    m_playbackToolbar = new QToolBar(tr("Playback"), this);
    m_playbackToolbar->setObjectName(QStringLiteral("PlaybackToolbar"));
    m_playbackToolbar->setMovable(false);
    m_playbackToolbar->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
    m_playbackToolbar->setIconSize(QSize(20, 20));
    addToolBar(Qt::BottomToolBarArea, m_playbackToolbar);

    m_playAction = m_playbackToolbar->addAction(style()->standardIcon(QStyle::SP_MediaPlay), tr("Play"));
    m_pauseAction = m_playbackToolbar->addAction(style()->standardIcon(QStyle::SP_MediaPause), tr("Pause"));
    m_resetAction = m_playbackToolbar->addAction(style()->standardIcon(QStyle::SP_MediaSkipBackward), tr("Reset"));
    m_playAction->setShortcut(QKeySequence(Qt::Key_Space));

    connect(m_playAction, &QAction::triggered, &m_playback, &render::PlaybackController::play);
    connect(m_pauseAction, &QAction::triggered, &m_playback, &render::PlaybackController::pause);
    connect(m_resetAction, &QAction::triggered, &m_playback, &render::PlaybackController::reset);

    m_playbackToolbar->addSeparator();
    m_playbackToolbar->addWidget(new QLabel(tr("Progress"), this));

    m_progressSlider = new QSlider(Qt::Horizontal, this);
    m_progressSlider->setRange(0, kSliderResolution);
    m_progressSlider->setPageStep(25);
    m_progressSlider->setValue(0);
    m_progressSlider->setFixedWidth(320);
    m_playbackToolbar->addWidget(m_progressSlider);

    m_progressLabel = new QLabel(QStringLiteral("0%"), this);
    m_progressLabel->setMinimumWidth(48);
    m_playbackToolbar->addWidget(m_progressLabel);

    connect(m_progressSlider, &QSlider::sliderPressed, this, [this]() { m_sliderPressed = true; });
    connect(m_progressSlider, &QSlider::sliderReleased, this, [this]() {
        m_sliderPressed = false;
        m_playback.seek(static_cast<double>(m_progressSlider->value()) / kSliderResolution);
    });
    connect(m_progressSlider, &QSlider::sliderMoved, this, [this](int value) {
        m_playback.seek(static_cast<double>(value) / kSliderResolution);
    });
    // Clicks and keyboard steps on the track.
    connect(m_progressSlider, &QSlider::actionTriggered, this, [this](int action) {
        if (action != QAbstractSlider::SliderMove && !m_sliderPressed)
        {
            m_playback.seek(static_cast<double>(m_progressSlider->sliderPosition()) / kSliderResolution);
        }
    });
}

void MainWindow::createStatusBar()
{
    auto* bar = new QStatusBar(this);
    bar->setObjectName(QStringLiteral("MainStatusBar"));
    bar->setSizeGripEnabled(false);
    setStatusBar(bar);

    auto makeLabel = [bar](const QString& text) {
        auto* label = new QLabel(text, bar);
        label->setObjectName(QStringLiteral("StatusValue"));
        label->setMinimumWidth(150);
        return label;
    };

    auto makeSeparator = [bar]() {
        auto* line = new QFrame(bar);
        line->setFrameShape(QFrame::VLine);
        line->setFrameShadow(QFrame::Plain);
        line->setFixedHeight(18);
        return line;
    };

    m_modelStatusLabel = makeLabel(QString());
    m_programStatusLabel = makeLabel(QString());
    m_errorLabel = makeLabel(QString());
    m_errorLabel->setStyleSheet(QStringLiteral("color: #F05E5E;"));
    m_gpuLabel = makeLabel(tr("GPU: detecting..."));
    m_fpsLabel = makeLabel(tr("FPS: --"));

    bar->addWidget(m_modelStatusLabel);
    bar->addWidget(makeSeparator());
    bar->addWidget(m_programStatusLabel);
    bar->addWidget(makeSeparator());
    bar->addWidget(m_errorLabel, 1);
    bar->addPermanentWidget(m_gpuLabel);
    bar->addPermanentWidget(makeSeparator());
    bar->addPermanentWidget(m_fpsLabel);

    updateSourceLabels();
}

void MainWindow::openModelFromFile()
{
    const QString selected = QFileDialog::getOpenFileName(this,
                                                          tr("Open Model"),
                                                          m_lastModelDir,
                                                          io::fileDialogFilter(io::SourceKind::Model));
    if (selected.isEmpty() || !acceptSelection(selected, io::SourceKind::Model))
    {
        return;
    }

    m_lastModelDir = QFileInfo(selected).absolutePath();
    m_modelSource = selected;
    m_loader->requestModel(selected);
}

void MainWindow::openProgramFromFile()
{
    const QString selected = QFileDialog::getOpenFileName(this,
                                                          tr("Open Program"),
                                                          m_lastProgramDir,
                                                          io::fileDialogFilter(io::SourceKind::Program));
    if (selected.isEmpty() || !acceptSelection(selected, io::SourceKind::Program))
    {
        return;
    }

    m_lastProgramDir = QFileInfo(selected).absolutePath();
    m_programSource = selected;
    m_loader->requestProgram(selected);
}

bool MainWindow::acceptSelection(const QString& path, io::SourceKind kind)
{
    if (io::hasAcceptedExtension(path, kind))
    {
        return true;
    }

    LOG_WARN(App, QStringLiteral("Rejected %1: expected a %2 file.").arg(QDir::toNativeSeparators(path), io::acceptedExtension(kind)));
    QMessageBox::warning(this,
                         tr("Unsupported File"),
                         tr("Please select a %1 file:\n%2").arg(io::acceptedExtension(kind), QDir::toNativeSeparators(path)));
    return false;
}

void MainWindow::onPlaybackStateChanged(render::PlaybackController::State state)
{
    const bool hasPath = !m_resources.pathVertices().empty();

    m_playAction->setEnabled(hasPath && state != render::PlaybackController::State::Playing);
    m_pauseAction->setEnabled(hasPath && state == render::PlaybackController::State::Playing);
    m_resetAction->setEnabled(hasPath && state != render::PlaybackController::State::Idle);
    m_progressSlider->setEnabled(hasPath);
}

void MainWindow::onPlaybackProgressChanged(double normalized)
{
    if (!m_sliderPressed)
    {
        const QSignalBlocker blocker(m_progressSlider);
        m_progressSlider->setValue(static_cast<int>(std::lround(normalized * kSliderResolution)));
    }
    m_progressLabel->setText(QStringLiteral("%1%").arg(static_cast<int>(std::lround(normalized * 100.0))));
}

void MainWindow::onLoadingChanged(render::Slot slot, bool loading)
{
    Q_UNUSED(slot);
    Q_UNUSED(loading);
    updateSourceLabels();
}

void MainWindow::onLoadFailed(render::Slot slot, const QString& message)
{
    const QString what = slot == render::Slot::Model ? tr("Model") : tr("Program");
    m_errorLabel->setText(tr("%1: %2").arg(what, message));
    m_errorLabel->setToolTip(message);
}

void MainWindow::updateSourceLabels()
{
    if (!m_modelStatusLabel)
    {
        return;
    }

    const QString modelName = sourceLabel(m_modelSource, tr("default part"));
    const QString programName = sourceLabel(m_programSource, tr("default program"));

    if (m_resources.isLoading(render::Slot::Model))
    {
        m_modelStatusLabel->setText(tr("Model: loading %1...").arg(modelName));
    }
    else if (m_resources.error(render::Slot::Model))
    {
        m_modelStatusLabel->setText(tr("Model: failed"));
    }
    else if (const auto& mesh = m_resources.activeModel(); mesh && mesh->model())
    {
        m_modelStatusLabel->setText(tr("Model: %1 (%2 triangles)").arg(modelName).arg(mesh->model()->triangleCount()));
    }
    else
    {
        m_modelStatusLabel->setText(tr("Model: none"));
    }

    if (m_resources.isLoading(render::Slot::Path))
    {
        m_programStatusLabel->setText(tr("Program: loading %1...").arg(programName));
    }
    else if (m_resources.error(render::Slot::Path))
    {
        m_programStatusLabel->setText(tr("Program: failed"));
    }
    else if (const auto status = m_resources.pathStatus())
    {
        m_programStatusLabel->setText(tr("Program: %1 (%2 points, %3)")
                                          .arg(programName)
                                          .arg(m_resources.pathVertices().size())
                                          .arg(QString::fromLatin1(gcode::pathStatusName(*status))));
    }
    else
    {
        m_programStatusLabel->setText(tr("Program: none"));
    }

    if (!m_resources.error(render::Slot::Model) && !m_resources.error(render::Slot::Path))
    {
        m_errorLabel->clear();
        m_errorLabel->setToolTip(QString());
    }
}

} // namespace app
