#pragma once

#include "common/math.h"

#include <QtGui/QVector3D>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace render
{

class Model;

// GPU-side storage of a render object. Created by the viewer with its OpenGL
// context current and destroyed the same way.
class GpuResource
{
public:
    virtual ~GpuResource() = default;
};

class RenderObject
{
public:
    enum class Kind
    {
        Mesh,
        PathLine
    };

    virtual ~RenderObject();

    RenderObject(const RenderObject&) = delete;
    RenderObject& operator=(const RenderObject&) = delete;

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }
    [[nodiscard]] std::uint64_t id() const noexcept { return m_id; }
    [[nodiscard]] bool isDisposed() const noexcept { return m_disposed; }

    // Releases geometry and GPU storage. Returns true only for the call that
    // performed the release; later calls are no-ops.
    bool dispose();

    void setGpuResource(std::unique_ptr<GpuResource> resource);
    [[nodiscard]] GpuResource* gpuResource() const noexcept { return m_gpu.get(); }
    [[nodiscard]] std::unique_ptr<GpuResource> takeGpuResource();

    // Objects constructed and not yet disposed, across the process.
    [[nodiscard]] static std::size_t undisposedCount() noexcept;

protected:
    explicit RenderObject(Kind kind);

    virtual void releaseGeometry() = 0;

private:
    Kind m_kind;
    std::uint64_t m_id;
    bool m_disposed{false};
    std::unique_ptr<GpuResource> m_gpu;
};

class PathLine final : public RenderObject
{
public:
    PathLine(std::vector<QVector3D> points, QVector3D color);

    [[nodiscard]] const std::vector<QVector3D>& points() const noexcept { return m_points; }
    [[nodiscard]] std::size_t pointCount() const noexcept { return m_points.size(); }
    [[nodiscard]] const QVector3D& color() const noexcept { return m_color; }

protected:
    void releaseGeometry() override;

private:
    std::vector<QVector3D> m_points;
    QVector3D m_color;
};

class MeshObject final : public RenderObject
{
public:
    MeshObject(std::shared_ptr<const Model> model, QVector3D color);

    [[nodiscard]] const std::shared_ptr<const Model>& model() const noexcept { return m_model; }
    [[nodiscard]] const QVector3D& color() const noexcept { return m_color; }
    [[nodiscard]] common::Bounds bounds() const;

protected:
    void releaseGeometry() override;

private:
    std::shared_ptr<const Model> m_model;
    QVector3D m_color;
};

} // namespace render
