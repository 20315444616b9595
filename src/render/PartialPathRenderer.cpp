#include "render/PartialPathRenderer.h"

#include "common/Enforce.h"
#include "render/Scene.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace render
{

std::size_t visiblePointCount(std::size_t total, double progress)
{
    if (std::isnan(progress) || progress <= 0.0)
    {
        return 0;
    }
    if (progress >= 1.0)
    {
        return total;
    }

    const auto scaled = static_cast<std::size_t>(std::ceil(static_cast<double>(total) * progress));
    return std::min(total, std::max<std::size_t>(2, scaled));
}

PartialPathRenderer::PartialPathRenderer(Scene& scene, QVector3D color)
    : m_scene(scene)
    , m_color(color)
{
}

PartialPathRenderer::~PartialPathRenderer()
{
    clear();
}

std::shared_ptr<PathLine> PartialPathRenderer::render(const std::vector<QVector3D>& fullVertices, double progress)
{
    const std::size_t count = visiblePointCount(fullVertices.size(), progress);
    DEBUG_ENFORCE(count <= fullVertices.size(), "Visible slice exceeds the path.");

    // Same source and same slice: the displayed line is already correct.
    if (m_current && m_source == &fullVertices && m_sourceSize == fullVertices.size() &&
        m_current->pointCount() == count)
    {
        return m_current;
    }

    std::vector<QVector3D> visible(fullVertices.begin(),
                                   fullVertices.begin() + static_cast<std::ptrdiff_t>(count));
    replace(std::make_shared<PathLine>(std::move(visible), m_color));

    m_source = &fullVertices;
    m_sourceSize = fullVertices.size();
    return m_current;
}

void PartialPathRenderer::clear()
{
    replace(nullptr);
    m_source = nullptr;
    m_sourceSize = 0;
}

std::size_t PartialPathRenderer::visibleCount() const noexcept
{
    return m_current ? m_current->pointCount() : 0;
}

std::optional<QVector3D> PartialPathRenderer::toolPosition() const
{
    if (!m_current || m_current->points().empty())
    {
        return std::nullopt;
    }
    return m_current->points().back();
}

void PartialPathRenderer::replace(std::shared_ptr<PathLine> next)
{
    std::shared_ptr<PathLine> previous = std::exchange(m_current, std::move(next));
    if (previous)
    {
        m_scene.detach(previous);
        previous->dispose();
    }
    if (m_current)
    {
        m_scene.attach(m_current);
    }
}

} // namespace render
