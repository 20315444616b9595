#pragma once

#include "render/CameraController.h"
#include "render/GpuBuffers.h"

#include <QtCore/QElapsedTimer>
#include <QtCore/QString>
#include <QtCore/QTimer>
#include <QtGui/QMatrix4x4>
#include <QtOpenGL/QOpenGLFunctions_3_3_Core>
#include <QtOpenGL/QOpenGLShaderProgram>
#include <QtOpenGLWidgets/QOpenGLWidget>

#include <memory>
#include <vector>

namespace render
{

class PlaybackController;
class ResourceLifecycleManager;
class Scene;

// Draws the scene graph with the reference grid, the dimmed full path and the
// tool marker. Its frame timer advances camera damping and playback.
class ModelViewerWidget : public QOpenGLWidget, protected QOpenGLFunctions_3_3_Core
{
    Q_OBJECT

public:
    ModelViewerWidget(Scene& scene,
                      ResourceLifecycleManager& resources,
                      PlaybackController& playback,
                      int frameIntervalMs,
                      QWidget* parent = nullptr);
    ~ModelViewerWidget() override;

    void resetCamera();
    void frameScene();

Q_SIGNALS:
    void rendererInfoChanged(const QString& vendor, const QString& renderer, const QString& version);
    void frameStatsUpdated(float fps);

protected:
    void initializeGL() override;
    void resizeGL(int width, int height) override;
    void paintGL() override;

    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    void onFrame();
    void releaseGpuResources();
    void syncSceneResources();
    void rebuildGridGeometry();
    void rebuildAxesGeometry();
    void rebuildToolGlyph();
    void rebuildFullPathOverlay();
    [[nodiscard]] common::Bounds sceneBounds() const;

    Scene& m_scene;
    ResourceLifecycleManager& m_resources;
    PlaybackController& m_playback;

    std::unique_ptr<QOpenGLShaderProgram> m_meshProgram;
    std::unique_ptr<QOpenGLShaderProgram> m_polylineProgram;

    std::unique_ptr<LineBuffer> m_grid;
    std::unique_ptr<LineBuffer> m_axes;
    std::unique_ptr<LineBuffer> m_fullPath;
    std::unique_ptr<MeshBuffer> m_toolGlyph;

    CameraController m_camera;
    QTimer m_frameTimer;
    QElapsedTimer m_clock;
    QElapsedTimer m_fpsTimer;
    int m_frameCounter{0};
    bool m_glReady{false};
    bool m_rendererReported{false};
    bool m_gridDirty{true};
    bool m_fullPathDirty{true};
    float m_toolRadius{1.0f};
};

} // namespace render
