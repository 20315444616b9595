#include "render/RenderObject.h"

#include "render/Model.h"

#include <atomic>
#include <utility>

namespace render
{

namespace
{

std::atomic<std::uint64_t> g_nextId{1};
std::atomic<std::size_t> g_undisposed{0};

} // namespace

RenderObject::RenderObject(Kind kind)
    : m_kind(kind)
    , m_id(g_nextId.fetch_add(1, std::memory_order_relaxed))
{
    g_undisposed.fetch_add(1, std::memory_order_relaxed);
}

RenderObject::~RenderObject()
{
    if (!m_disposed)
    {
        g_undisposed.fetch_sub(1, std::memory_order_relaxed);
    }
}

bool RenderObject::dispose()
{
    if (m_disposed)
    {
        return false;
    }

    m_disposed = true;
    m_gpu.reset();
    releaseGeometry();
    g_undisposed.fetch_sub(1, std::memory_order_relaxed);
    return true;
}

void RenderObject::setGpuResource(std::unique_ptr<GpuResource> resource)
{
    m_gpu = std::move(resource);
}

std::unique_ptr<GpuResource> RenderObject::takeGpuResource()
{
    return std::move(m_gpu);
}

std::size_t RenderObject::undisposedCount() noexcept
{
    return g_undisposed.load(std::memory_order_relaxed);
}

PathLine::PathLine(std::vector<QVector3D> points, QVector3D color)
    : RenderObject(Kind::PathLine)
    , m_points(std::move(points))
    , m_color(color)
{
}

void PathLine::releaseGeometry()
{
    std::vector<QVector3D>().swap(m_points);
}

MeshObject::MeshObject(std::shared_ptr<const Model> model, QVector3D color)
    : RenderObject(Kind::Mesh)
    , m_model(std::move(model))
    , m_color(color)
{
}

common::Bounds MeshObject::bounds() const
{
    return m_model ? m_model->bounds() : common::Bounds{};
}

void MeshObject::releaseGeometry()
{
    m_model.reset();
}

} // namespace render
