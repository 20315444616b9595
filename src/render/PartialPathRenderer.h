#pragma once

#include "render/RenderObject.h"

#include <QtGui/QVector3D>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace render
{

class Scene;

// Number of leading vertices visible at the given progress: none at 0, all at
// 1, otherwise at least one full segment.
std::size_t visiblePointCount(std::size_t total, double progress);

// Owns the displayed path line. Each render() replaces the previous line in the
// scene and disposes it.
class PartialPathRenderer
{
public:
    static constexpr QVector3D kDefaultColor{1.0f, 0.15f, 0.1f};

    explicit PartialPathRenderer(Scene& scene, QVector3D color = kDefaultColor);
    ~PartialPathRenderer();

    PartialPathRenderer(const PartialPathRenderer&) = delete;
    PartialPathRenderer& operator=(const PartialPathRenderer&) = delete;

    std::shared_ptr<PathLine> render(const std::vector<QVector3D>& fullVertices, double progress);
    void clear();

    [[nodiscard]] const std::shared_ptr<PathLine>& current() const noexcept { return m_current; }
    [[nodiscard]] std::size_t visibleCount() const noexcept;

    // Tip of the visible path, where the tool marker is drawn.
    [[nodiscard]] std::optional<QVector3D> toolPosition() const;

private:
    void replace(std::shared_ptr<PathLine> next);

    Scene& m_scene;
    QVector3D m_color;
    std::shared_ptr<PathLine> m_current;
    const std::vector<QVector3D>* m_source{nullptr};
    std::size_t m_sourceSize{0};
};

} // namespace render
