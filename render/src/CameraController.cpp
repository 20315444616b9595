#include "render/CameraController.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace render
{

namespace
{
constexpr float kMinDistance = 0.1f;
constexpr float kMaxDistance = 10'000.0f;
constexpr float kOrbitSensitivity = 0.005f;
constexpr float kPanSensitivity = 0.0025f;
constexpr float kZoomFactor = 0.1f;
constexpr float kPitchLimit = 1.55334306f; // ~89 degrees in radians
constexpr float kSettleEpsilon = 1e-4f;
constexpr float kDefaultYaw = -0.8f;
constexpr float kDefaultPitch = 0.6f;
}

void CameraController::frame(const common::Bounds& bounds)
{
    m_bounds = bounds;
    m_target = bounds.valid ? bounds.center() : QVector3D{};
    const QVector3D size = bounds.size();
    const float radius = std::max({size.x(), size.y(), size.z(), 10.0f});
    m_distance = std::clamp(radius * 2.0f, kMinDistance, kMaxDistance);
    m_pendingYaw = 0.0f;
    m_pendingPitch = 0.0f;
    m_pendingPan = {};
    m_viewDirty = true;
}

void CameraController::setViewportSize(const QSize& size)
{
    if (size.width() <= 0 || size.height() <= 0 || size == m_viewportSize)
    {
        return;
    }
    m_viewportSize = size;
    m_projectionDirty = true;
}

void CameraController::setDamping(float factor)
{
    m_damping = std::clamp(factor, 0.01f, 1.0f);
}

void CameraController::beginOrbit(const QPoint& position)
{
    m_isOrbiting = true;
    m_lastCursor = position;
}

void CameraController::updateOrbit(const QPoint& position)
{
    if (!m_isOrbiting)
    {
        return;
    }
    const QPoint delta = position - m_lastCursor;
    m_lastCursor = position;

    m_pendingYaw -= delta.x() * kOrbitSensitivity;
    m_pendingPitch += delta.y() * kOrbitSensitivity;
}

void CameraController::endOrbit()
{
    m_isOrbiting = false;
}

void CameraController::beginPan(const QPoint& position)
{
    m_isPanning = true;
    m_lastCursor = position;
}

void CameraController::updatePan(const QPoint& position)
{
    if (!m_isPanning)
    {
        return;
    }
    const QPoint delta = position - m_lastCursor;
    m_lastCursor = position;

    const float aspect = static_cast<float>(m_viewportSize.width()) / std::max(1, m_viewportSize.height());
    const float scale = m_distance * kPanSensitivity;

    QVector3D forward = m_target - cameraPosition();
    forward.normalize();
    QVector3D right = QVector3D::crossProduct(forward, {0.0f, 0.0f, 1.0f});
    if (right.lengthSquared() < 0.0001f)
    {
        right = {1.0f, 0.0f, 0.0f};
    }
    right.normalize();
    const QVector3D up = QVector3D::crossProduct(right, forward);

    m_pendingPan += (-right * delta.x() * scale * aspect) + (up * delta.y() * scale);
}

void CameraController::endPan()
{
    m_isPanning = false;
}

void CameraController::applyZoom(float deltaSteps)
{
    const float factor = 1.0f + deltaSteps * kZoomFactor;
    m_distance = std::clamp(m_distance * factor, kMinDistance, kMaxDistance);
    m_viewDirty = true;
}

bool CameraController::advance()
{
    const bool moving = std::abs(m_pendingYaw) > kSettleEpsilon || std::abs(m_pendingPitch) > kSettleEpsilon ||
                        m_pendingPan.lengthSquared() > kSettleEpsilon * kSettleEpsilon;
    if (!moving)
    {
        m_pendingYaw = 0.0f;
        m_pendingPitch = 0.0f;
        m_pendingPan = {};
        return false;
    }

    m_yaw += m_pendingYaw * m_damping;
    m_pitch = std::clamp(m_pitch + m_pendingPitch * m_damping, -kPitchLimit, kPitchLimit);
    m_target += m_pendingPan * m_damping;

    m_pendingYaw *= 1.0f - m_damping;
    m_pendingPitch *= 1.0f - m_damping;
    m_pendingPan *= 1.0f - m_damping;

    m_viewDirty = true;
    return true;
}

const QMatrix4x4& CameraController::viewMatrix() const
{
    updateViewMatrix();
    return m_viewMatrix;
}

const QMatrix4x4& CameraController::projectionMatrix() const
{
    updateProjectionMatrix();
    return m_projectionMatrix;
}

QVector3D CameraController::cameraPosition() const
{
    const float cosPitch = std::cos(m_pitch);
    const float sinPitch = std::sin(m_pitch);
    const float cosYaw = std::cos(m_yaw);
    const float sinYaw = std::sin(m_yaw);

    QVector3D offset;
    offset.setX(m_distance * cosPitch * cosYaw);
    offset.setY(m_distance * cosPitch * sinYaw);
    offset.setZ(m_distance * sinPitch);

    return m_target + offset;
}

void CameraController::reset()
{
    frame(m_bounds);
    m_yaw = kDefaultYaw;
    m_pitch = kDefaultPitch;
    m_viewDirty = true;
}

void CameraController::updateViewMatrix() const
{
    if (!m_viewDirty)
    {
        return;
    }
    m_viewMatrix.setToIdentity();
    m_viewMatrix.lookAt(cameraPosition(), m_target, QVector3D{0.0f, 0.0f, 1.0f});
    m_viewDirty = false;
}

void CameraController::updateProjectionMatrix() const
{
    if (!m_projectionDirty)
    {
        return;
    }
    const float aspect = static_cast<float>(m_viewportSize.width()) / std::max(1, m_viewportSize.height());
    m_projectionMatrix = common::perspectiveRadians(45.0f * std::numbers::pi_v<float> / 180.0f,
                                                    aspect,
                                                    std::max(0.01f, m_distance * 0.001f),
                                                    std::max(5'000.0f, m_distance * 20.0f));
    m_projectionDirty = false;
}

} // namespace render
