#pragma once

#include "common/math.h"

#include <QtCore/QPoint>
#include <QtCore/QSize>
#include <QtGui/QMatrix4x4>
#include <QtGui/QVector3D>

namespace render
{

// Z-up orbit camera. Orbit and pan input is accumulated and eased out over the
// following frames by advance().
class CameraController
{
public:
    static constexpr float kDefaultDamping = 0.05f;

    void frame(const common::Bounds& bounds);
    void setViewportSize(const QSize& size);
    void setDamping(float factor);

    void beginOrbit(const QPoint& position);
    void updateOrbit(const QPoint& position);
    void endOrbit();

    void beginPan(const QPoint& position);
    void updatePan(const QPoint& position);
    void endPan();

    void applyZoom(float deltaSteps);

    // Applies part of the pending motion. Returns true while the camera is still moving.
    bool advance();

    [[nodiscard]] const QMatrix4x4& viewMatrix() const;
    [[nodiscard]] const QMatrix4x4& projectionMatrix() const;
    [[nodiscard]] QVector3D cameraPosition() const;
    [[nodiscard]] float distance() const { return m_distance; }

    void reset();

private:
    void updateViewMatrix() const;
    void updateProjectionMatrix() const;

    common::Bounds m_bounds;
    QSize m_viewportSize{1, 1};

    QVector3D m_target{0.0f, 0.0f, 0.0f};
    float m_distance{150.0f};
    float m_yaw{-0.8f};
    float m_pitch{0.6f};

    float m_pendingYaw{0.0f};
    float m_pendingPitch{0.0f};
    QVector3D m_pendingPan{0.0f, 0.0f, 0.0f};
    float m_damping{kDefaultDamping};

    QPoint m_lastCursor{};
    bool m_isOrbiting{false};
    bool m_isPanning{false};

    mutable bool m_viewDirty{true};
    mutable bool m_projectionDirty{true};
    mutable QMatrix4x4 m_viewMatrix;
    mutable QMatrix4x4 m_projectionMatrix;
};

} // namespace render
