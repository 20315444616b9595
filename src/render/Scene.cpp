#include "render/Scene.h"

#include "common/log.h"

#include <QtCore/QString>

#include <algorithm>
#include <utility>

namespace render
{

Scene::~Scene()
{
    if (!m_objects.empty())
    {
        LOG_DEBUG(Render, QStringLiteral("Scene destroyed with %1 attached objects.").arg(m_objects.size()));
    }
}

bool Scene::attach(std::shared_ptr<RenderObject> object)
{
    if (!object || object->isDisposed() || contains(object.get()))
    {
        return false;
    }

    m_objects.push_back(std::move(object));
    ++m_revision;
    return true;
}

bool Scene::detach(const std::shared_ptr<RenderObject>& object)
{
    if (!object)
    {
        return false;
    }

    const auto it = std::find(m_objects.begin(), m_objects.end(), object);
    if (it == m_objects.end())
    {
        return false;
    }

    if (std::unique_ptr<GpuResource> gpu = object->takeGpuResource())
    {
        m_pendingReleases.push_back(std::move(gpu));
    }

    m_objects.erase(it);
    ++m_revision;
    return true;
}

bool Scene::contains(const RenderObject* object) const
{
    return std::any_of(m_objects.begin(), m_objects.end(), [object](const std::shared_ptr<RenderObject>& entry) {
        return entry.get() == object;
    });
}

std::vector<std::unique_ptr<GpuResource>> Scene::takePendingReleases()
{
    return std::exchange(m_pendingReleases, {});
}

} // namespace render
