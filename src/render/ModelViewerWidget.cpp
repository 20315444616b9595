#include "render/ModelViewerWidget.h"

#include "common/log.h"
#include "render/Model.h"
#include "render/PlaybackController.h"
#include "render/RenderObject.h"
#include "render/ResourceLifecycleManager.h"
#include "render/Scene.h"

#include <QtGui/QMouseEvent>
#include <QtGui/QOpenGLContext>
#include <QtGui/QWheelEvent>
#include <QtOpenGL/QOpenGLShader>

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

namespace render
{

namespace
{
constexpr QVector3D kGridColor{0.25f, 0.25f, 0.25f};
constexpr QVector3D kFullPathColor{0.45f, 0.5f, 0.6f};
constexpr QVector3D kToolColor{0.95f, 0.85f, 0.2f};
constexpr float kFullPathAlpha = 0.35f;
constexpr float kPathAlpha = 1.0f;

bool buildProgram(QOpenGLShaderProgram& program, const QString& vertexPath, const QString& fragmentPath)
{
    if (!program.addShaderFromSourceFile(QOpenGLShader::Vertex, vertexPath) ||
        !program.addShaderFromSourceFile(QOpenGLShader::Fragment, fragmentPath) || !program.link())
    {
        LOG_ERR(Render, QStringLiteral("Shader program %1 failed: %2").arg(vertexPath, program.log()));
        return false;
    }
    return true;
}
}

ModelViewerWidget::ModelViewerWidget(Scene& scene,
                                     ResourceLifecycleManager& resources,
                                     PlaybackController& playback,
                                     int frameIntervalMs,
                                     QWidget* parent)
    : QOpenGLWidget(parent)
    , m_scene(scene)
    , m_resources(resources)
    , m_playback(playback)
{
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(true);
    setMinimumSize(640, 480);

    connect(&m_resources, &ResourceLifecycleManager::modelChanged, this, [this]() {
        m_gridDirty = true;
        frameScene();
    });
    connect(&m_resources, &ResourceLifecycleManager::pathChanged, this, [this]() {
        m_fullPathDirty = true;
        frameScene();
    });
    connect(&m_resources, &ResourceLifecycleManager::pathProgressRendered, this, [this]() { update(); });

    m_frameTimer.setInterval(std::max(1, frameIntervalMs));
    connect(&m_frameTimer, &QTimer::timeout, this, &ModelViewerWidget::onFrame);
    m_clock.start();
    m_frameTimer.start();
}

ModelViewerWidget::~ModelViewerWidget()
{
    m_frameTimer.stop();
    releaseGpuResources();
}

void ModelViewerWidget::resetCamera()
{
    m_camera.reset();
    update();
}

void ModelViewerWidget::frameScene()
{
    m_camera.frame(sceneBounds());
    update();
}

void ModelViewerWidget::initializeGL()
{
    initializeOpenGLFunctions();
    glEnable(GL_DEPTH_TEST);
    glEnable(GL_MULTISAMPLE);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glClearColor(0.08f, 0.09f, 0.11f, 1.0f);

    if (!m_rendererReported)
    {
        const auto* vendorPtr = reinterpret_cast<const char*>(glGetString(GL_VENDOR));
        const auto* rendererPtr = reinterpret_cast<const char*>(glGetString(GL_RENDERER));
        const auto* versionPtr = reinterpret_cast<const char*>(glGetString(GL_VERSION));
        const QString vendor = vendorPtr ? QString::fromLatin1(vendorPtr).trimmed() : QStringLiteral("Unknown");
        const QString renderer = rendererPtr ? QString::fromLatin1(rendererPtr).trimmed() : QStringLiteral("Unknown");
        const QString version = versionPtr ? QString::fromLatin1(versionPtr).trimmed() : QStringLiteral("Unknown");
        LOG_INFO(Render, QStringLiteral("OpenGL %1 on %2 (%3)").arg(version, renderer, vendor));
        Q_EMIT rendererInfoChanged(vendor, renderer, version);
        m_rendererReported = true;
    }

    m_meshProgram = std::make_unique<QOpenGLShaderProgram>();
    m_polylineProgram = std::make_unique<QOpenGLShaderProgram>();
    const bool meshOk = buildProgram(*m_meshProgram,
                                     QStringLiteral(":/render/shaders/flat.vert"),
                                     QStringLiteral(":/render/shaders/flat.frag"));
    const bool lineOk = buildProgram(*m_polylineProgram,
                                     QStringLiteral(":/render/shaders/polyline.vert"),
                                     QStringLiteral(":/render/shaders/polyline.frag"));
    m_glReady = meshOk && lineOk;

    m_grid = std::make_unique<LineBuffer>(this);
    m_axes = std::make_unique<LineBuffer>(this);
    m_fullPath = std::make_unique<LineBuffer>(this);
    m_toolGlyph = std::make_unique<MeshBuffer>(this);

    m_gridDirty = true;
    m_fullPathDirty = true;
    rebuildAxesGeometry();
    rebuildToolGlyph();

    m_fpsTimer.invalidate();
    m_frameCounter = 0;

    // A recreated context invalidates buffers that were created on the old one.
    connect(context(), &QOpenGLContext::aboutToBeDestroyed, this, &ModelViewerWidget::releaseGpuResources,
            Qt::UniqueConnection);
}

void ModelViewerWidget::resizeGL(int width, int height)
{
    m_camera.setViewportSize({width, height});
}

void ModelViewerWidget::paintGL()
{
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    if (!m_glReady)
    {
        return;
    }

    m_camera.setViewportSize(size());
    syncSceneResources();

    if (m_gridDirty)
    {
        rebuildGridGeometry();
    }
    if (m_fullPathDirty)
    {
        rebuildFullPathOverlay();
    }

    const QMatrix4x4 modelMatrix;
    const QMatrix4x4& viewMatrix = m_camera.viewMatrix();
    const QMatrix4x4& projMatrix = m_camera.projectionMatrix();
    const QMatrix4x4 mvp = projMatrix * viewMatrix;

    m_grid->draw(*m_polylineProgram, mvp, kGridColor, 0.6f, GL_LINES);

    for (const std::shared_ptr<RenderObject>& object : m_scene.objects())
    {
        if (object->kind() != RenderObject::Kind::Mesh)
        {
            continue;
        }
        const auto& mesh = static_cast<const MeshObject&>(*object);
        if (auto* buffer = dynamic_cast<MeshBuffer*>(object->gpuResource()))
        {
            buffer->draw(*m_meshProgram, modelMatrix, viewMatrix, projMatrix, mesh.color());
        }
    }

    // Paths stay visible through the part.
    glDisable(GL_DEPTH_TEST);
    m_fullPath->draw(*m_polylineProgram, mvp, kFullPathColor, kFullPathAlpha);
    for (const std::shared_ptr<RenderObject>& object : m_scene.objects())
    {
        if (object->kind() != RenderObject::Kind::PathLine)
        {
            continue;
        }
        const auto& line = static_cast<const PathLine&>(*object);
        if (auto* buffer = dynamic_cast<LineBuffer*>(object->gpuResource()))
        {
            buffer->draw(*m_polylineProgram, mvp, line.color(), kPathAlpha);
        }
    }
    glEnable(GL_DEPTH_TEST);

    if (const std::optional<QVector3D> tool = m_resources.toolPosition())
    {
        QMatrix4x4 toolModel;
        toolModel.translate(*tool);
        toolModel.scale(m_toolRadius);
        m_toolGlyph->draw(*m_meshProgram, toolModel, viewMatrix, projMatrix, kToolColor);
    }

    m_axes->draw(*m_polylineProgram, mvp, QVector3D{1.0f, 0.1f, 0.1f}, 1.0f, GL_LINES, 0, 2);
    m_axes->draw(*m_polylineProgram, mvp, QVector3D{0.1f, 1.0f, 0.1f}, 1.0f, GL_LINES, 2, 2);
    m_axes->draw(*m_polylineProgram, mvp, QVector3D{0.1f, 0.4f, 1.0f}, 1.0f, GL_LINES, 4, 2);

    if (!m_fpsTimer.isValid())
    {
        m_fpsTimer.start();
        m_frameCounter = 0;
    }
    ++m_frameCounter;
    const qint64 elapsedMs = m_fpsTimer.elapsed();
    if (elapsedMs >= 1'000)
    {
        const float fps = static_cast<float>(m_frameCounter) * 1'000.0f / std::max<qint64>(elapsedMs, 1);
        Q_EMIT frameStatsUpdated(fps);
        m_frameCounter = 0;
        m_fpsTimer.restart();
    }
}

void ModelViewerWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->buttons() & Qt::LeftButton)
    {
        m_camera.beginOrbit(event->pos());
    }
    else if (event->buttons() & Qt::MiddleButton || (event->buttons() & Qt::RightButton))
    {
        m_camera.beginPan(event->pos());
    }
    event->accept();
}

void ModelViewerWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (event->buttons() & Qt::LeftButton)
    {
        m_camera.updateOrbit(event->pos());
    }
    else if (event->buttons() & Qt::MiddleButton || (event->buttons() & Qt::RightButton))
    {
        m_camera.updatePan(event->pos());
    }
    event->accept();
}

void ModelViewerWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton)
    {
        m_camera.endOrbit();
    }
    else if (event->button() == Qt::MiddleButton || event->button() == Qt::RightButton)
    {
        m_camera.endPan();
    }
    update();
}

void ModelViewerWidget::wheelEvent(QWheelEvent* event)
{
    constexpr float stepsPerDegree = 1.0f / 120.0f;
    const float numSteps = event->angleDelta().y() * stepsPerDegree;
    m_camera.applyZoom(-numSteps);
    update();
}

void ModelViewerWidget::onFrame()
{
    bool dirty = m_camera.advance();
    if (m_playback.wantsTicks())
    {
        m_playback.tick(static_cast<double>(m_clock.nsecsElapsed()) / 1'000'000.0);
        dirty = true;
    }
    if (dirty || m_scene.pendingReleaseCount() > 0)
    {
        update();
    }
}

void ModelViewerWidget::releaseGpuResources()
{
    if (!m_glReady && !m_grid)
    {
        return;
    }

    makeCurrent();
    for (const std::shared_ptr<RenderObject>& object : m_scene.objects())
    {
        object->takeGpuResource().reset();
    }
    m_scene.takePendingReleases().clear();
    m_grid.reset();
    m_axes.reset();
    m_fullPath.reset();
    m_toolGlyph.reset();
    m_meshProgram.reset();
    m_polylineProgram.reset();
    doneCurrent();

    m_glReady = false;
}

void ModelViewerWidget::syncSceneResources()
{
    // Storage of detached objects; the context is current here.
    m_scene.takePendingReleases().clear();

    for (const std::shared_ptr<RenderObject>& object : m_scene.objects())
    {
        if (object->gpuResource() || object->isDisposed())
        {
            continue;
        }

        if (object->kind() == RenderObject::Kind::Mesh)
        {
            const auto& mesh = static_cast<const MeshObject&>(*object);
            auto buffer = std::make_unique<MeshBuffer>(this);
            if (mesh.model())
            {
                buffer->upload(*mesh.model());
            }
            object->setGpuResource(std::move(buffer));
        }
        else
        {
            const auto& line = static_cast<const PathLine&>(*object);
            auto buffer = std::make_unique<LineBuffer>(this);
            buffer->upload(line.points());
            object->setGpuResource(std::move(buffer));
        }
    }
}

void ModelViewerWidget::rebuildGridGeometry()
{
    m_gridDirty = false;

    const common::Bounds bounds = sceneBounds();
    const QVector3D size = bounds.size();
    float extent = std::max({std::abs(size.x()), std::abs(size.y())});
    if (extent < 20.0f)
    {
        extent = 200.0f;
    }
    extent *= 0.6f;

    const int linesPerSide = 10;
    const float spacing = extent / static_cast<float>(linesPerSide);
    const QVector3D center = bounds.valid ? bounds.center() : QVector3D{};

    std::vector<QVector3D> gridLines;
    gridLines.reserve((linesPerSide * 2 + 1) * 4);
    for (int i = -linesPerSide; i <= linesPerSide; ++i)
    {
        const float offset = static_cast<float>(i) * spacing;
        gridLines.emplace_back(center.x() - extent, center.y() + offset, 0.0f);
        gridLines.emplace_back(center.x() + extent, center.y() + offset, 0.0f);
        gridLines.emplace_back(center.x() + offset, center.y() - extent, 0.0f);
        gridLines.emplace_back(center.x() + offset, center.y() + extent, 0.0f);
    }
    m_grid->upload(gridLines);

    m_toolRadius = std::clamp(extent * 0.01f, 0.3f, 5.0f);
}

void ModelViewerWidget::rebuildAxesGeometry()
{
    const float axisLength = 50.0f;
    const std::vector<QVector3D> axes = {
        QVector3D{0.0f, 0.0f, 0.0f}, QVector3D{axisLength, 0.0f, 0.0f},
        QVector3D{0.0f, 0.0f, 0.0f}, QVector3D{0.0f, axisLength, 0.0f},
        QVector3D{0.0f, 0.0f, 0.0f}, QVector3D{0.0f, 0.0f, axisLength},
    };
    m_axes->upload(axes);
}

void ModelViewerWidget::rebuildToolGlyph()
{
    constexpr int stacks = 12;
    constexpr int slices = 24;

    std::vector<Vertex> vertices;
    vertices.reserve((stacks + 1) * (slices + 1));
    for (int i = 0; i <= stacks; ++i)
    {
        const double phi = static_cast<double>(i) / stacks * std::numbers::pi_v<double>;
        for (int j = 0; j <= slices; ++j)
        {
            const double theta = static_cast<double>(j) / slices * 2.0 * std::numbers::pi_v<double>;
            const QVector3D normal(static_cast<float>(std::sin(phi) * std::cos(theta)),
                                   static_cast<float>(std::sin(phi) * std::sin(theta)),
                                   static_cast<float>(std::cos(phi)));
            vertices.push_back({normal, normal});
        }
    }

    std::vector<Model::Index> indices;
    indices.reserve(stacks * slices * 6);
    const int ringSize = slices + 1;
    for (int i = 0; i < stacks; ++i)
    {
        for (int j = 0; j < slices; ++j)
        {
            const auto first = static_cast<Model::Index>(i * ringSize + j);
            const auto second = first + static_cast<Model::Index>(ringSize);
            indices.insert(indices.end(), {first, second, first + 1, second, second + 1, first + 1});
        }
    }

    Model sphere;
    sphere.setName(QStringLiteral("tool_marker"));
    sphere.setMeshData(std::move(vertices), std::move(indices));
    m_toolGlyph->upload(sphere);
}

void ModelViewerWidget::rebuildFullPathOverlay()
{
    m_fullPathDirty = false;
    m_fullPath->upload(m_resources.pathVertices());
}

common::Bounds ModelViewerWidget::sceneBounds() const
{
    common::Bounds bounds;
    if (const std::shared_ptr<MeshObject>& mesh = m_resources.activeModel())
    {
        bounds.expand(mesh->bounds());
    }
    bounds.expand(m_resources.pathBounds());
    return bounds;
}

} // namespace render
