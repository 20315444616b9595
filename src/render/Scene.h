#pragma once

#include "render/RenderObject.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace render
{

// Passive scene graph drawn by the viewer every frame. Detached objects hand
// their GPU storage to a release queue that the viewer drains while its
// context is current.
class Scene
{
public:
    Scene() = default;
    ~Scene();

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    // Returns false when the object is already attached or has been disposed.
    bool attach(std::shared_ptr<RenderObject> object);
    bool detach(const std::shared_ptr<RenderObject>& object);

    [[nodiscard]] bool contains(const RenderObject* object) const;
    [[nodiscard]] const std::vector<std::shared_ptr<RenderObject>>& objects() const noexcept { return m_objects; }
    [[nodiscard]] std::size_t size() const noexcept { return m_objects.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_objects.empty(); }

    // Incremented on every attach and detach.
    [[nodiscard]] std::uint64_t revision() const noexcept { return m_revision; }

    [[nodiscard]] std::vector<std::unique_ptr<GpuResource>> takePendingReleases();
    [[nodiscard]] std::size_t pendingReleaseCount() const noexcept { return m_pendingReleases.size(); }

private:
    std::vector<std::shared_ptr<RenderObject>> m_objects;
    std::vector<std::unique_ptr<GpuResource>> m_pendingReleases;
    std::uint64_t m_revision{0};
};

} // namespace render
