#pragma once

#include "common/Settings.h"
#include "io/SourceReader.h"
#include "render/PlaybackController.h"
#include "render/ResourceLifecycleManager.h"
#include "render/Scene.h"

#include <QtCore/QDir>
#include <QtCore/QString>
#include <QtWidgets/QMainWindow>

#include <memory>

class QAction;
class QLabel;
class QSlider;
class QToolBar;

namespace render
{
class ModelViewerWidget;
}

namespace app
{

class LoadCoordinator;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(common::Settings settings, QWidget* parent = nullptr);
    ~MainWindow() override;

    // Empty paths load the configured or embedded defaults.
    void loadInitialAssets(const QString& modelPath, const QString& programPath);

private:
    void createActions();
    void createPlaybackToolbar();
    void createStatusBar();

    void openModelFromFile();
    void openProgramFromFile();
    bool acceptSelection(const QString& path, io::SourceKind kind);

    void onPlaybackStateChanged(render::PlaybackController::State state);
    void onPlaybackProgressChanged(double normalized);
    void onLoadingChanged(render::Slot slot, bool loading);
    void onLoadFailed(render::Slot slot, const QString& message);
    void updateSourceLabels();

    common::Settings m_settings;

    render::Scene m_scene;
    render::PlaybackController m_playback;
    render::ResourceLifecycleManager m_resources;
    std::unique_ptr<LoadCoordinator> m_loader;

    render::ModelViewerWidget* m_viewer{nullptr};

    QToolBar* m_playbackToolbar{nullptr};
    QAction* m_playAction{nullptr};
    QAction* m_pauseAction{nullptr};
    QAction* m_resetAction{nullptr};
    QSlider* m_progressSlider{nullptr};
    QLabel* m_progressLabel{nullptr};
    bool m_sliderPressed{false};

    QLabel* m_modelStatusLabel{nullptr};
    QLabel* m_programStatusLabel{nullptr};
    QLabel* m_errorLabel{nullptr};
    QLabel* m_fpsLabel{nullptr};
    QLabel* m_gpuLabel{nullptr};

    QString m_modelSource;
    QString m_programSource;

    // Dialog start directories, kept for this session only.
    QString m_lastModelDir{QDir::homePath()};
    QString m_lastProgramDir{QDir::homePath()};
};

} // namespace app
