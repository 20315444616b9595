#include "common/math.h"

#include <algorithm>
#include <numbers>

namespace common
{

void Bounds::expand(const QVector3D& point)
{
    if (!valid)
    {
        min = point;
        max = point;
        valid = true;
        return;
    }

    min.setX(std::min(min.x(), point.x()));
    min.setY(std::min(min.y(), point.y()));
    min.setZ(std::min(min.z(), point.z()));

    max.setX(std::max(max.x(), point.x()));
    max.setY(std::max(max.y(), point.y()));
    max.setZ(std::max(max.z(), point.z()));
}

void Bounds::expand(const Bounds& other)
{
    if (!other.valid)
    {
        return;
    }
    expand(other.min);
    expand(other.max);
}

Bounds boundsOf(const std::vector<QVector3D>& points)
{
    Bounds result;
    for (const QVector3D& point : points)
    {
        result.expand(point);
    }
    return result;
}

QMatrix4x4 perspectiveRadians(float fovRadians, float aspect, float nearPlane, float farPlane)
{
    QMatrix4x4 matrix;
    constexpr float radToDeg = 180.0f / std::numbers::pi_v<float>;
    matrix.perspective(fovRadians * radToDeg, aspect, nearPlane, farPlane);
    return matrix;
}

} // namespace common
