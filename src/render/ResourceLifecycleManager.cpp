#include "render/ResourceLifecycleManager.h"

#include "common/Enforce.h"
#include "common/log.h"
#include "render/PlaybackController.h"
#include "render/Scene.h"

#include <utility>

namespace render
{

const char* slotName(Slot slot)
{
    switch (slot)
    {
    case Slot::Model: return "model";
    case Slot::Path: return "path";
    }
    return "unknown";
}

ResourceLifecycleManager::ResourceLifecycleManager(Scene& scene, PlaybackController& playback, QObject* parent)
    : QObject(parent)
    , m_scene(scene)
    , m_playback(playback)
    , m_pathRenderer(scene)
{
    connect(&m_playback, &PlaybackController::progressChanged, this, &ResourceLifecycleManager::setPathProgress);
}

ResourceLifecycleManager::~ResourceLifecycleManager()
{
    teardown();
}

LoadTicket ResourceLifecycleManager::beginLoad(Slot slot)
{
    SlotState& slotState = state(slot);
    ++slotState.generation;
    setLoading(slot, true);

    LOG_DEBUG(Render, QStringLiteral("Load %1 #%2 started.").arg(QString::fromLatin1(slotName(slot))).arg(slotState.generation));
    return LoadTicket{slot, slotState.generation};
}

bool ResourceLifecycleManager::isCurrent(const LoadTicket& ticket) const noexcept
{
    return ticket.generation != 0 && ticket.generation == state(ticket.slot).generation;
}

bool ResourceLifecycleManager::completeModelLoad(const LoadTicket& ticket, std::shared_ptr<MeshObject> mesh)
{
    ENFORCE(ticket.slot == Slot::Model, "Model result delivered with a path ticket.");

    if (!isCurrent(ticket))
    {
        LOG_INFO(Render, QStringLiteral("Discarding stale model load #%1 (current #%2).")
                             .arg(ticket.generation)
                             .arg(m_model.generation));
        if (mesh)
        {
            mesh->dispose();
        }
        return false;
    }

    if (!mesh || mesh->isDisposed())
    {
        return failLoad(ticket, io::LoadError{io::LoadErrorKind::Decode, QStringLiteral("Model is empty or invalid.")});
    }

    disposeModel();
    m_model.resource = std::move(mesh);
    m_scene.attach(m_model.resource);
    m_model.error.reset();
    setLoading(Slot::Model, false);

    Q_EMIT modelChanged();
    return true;
}

bool ResourceLifecycleManager::completePathLoad(const LoadTicket& ticket, gcode::PathBuildResult result)
{
    ENFORCE(ticket.slot == Slot::Path, "Path result delivered with a model ticket.");

    if (!isCurrent(ticket))
    {
        LOG_INFO(Render, QStringLiteral("Discarding stale path load #%1 (current #%2).")
                             .arg(ticket.generation)
                             .arg(m_path.generation));
        return false;
    }

    clearPath();

    m_pathVertices.reserve(result.vertices.size());
    for (const glm::dvec3& vertex : result.vertices)
    {
        m_pathVertices.emplace_back(static_cast<float>(vertex.x), static_cast<float>(vertex.y), static_cast<float>(vertex.z));
    }
    m_pathStatus = result.status;
    m_pathBounds = common::boundsOf(m_pathVertices);
    m_path.error.reset();

    m_playback.resetForPath();
    if (!m_pathVertices.empty())
    {
        m_pathRenderer.render(m_pathVertices, m_playback.progress());
    }
    setLoading(Slot::Path, false);

    Q_EMIT pathChanged();
    return true;
}

bool ResourceLifecycleManager::failLoad(const LoadTicket& ticket, const io::LoadError& error)
{
    if (!isCurrent(ticket))
    {
        LOG_INFO(Render, QStringLiteral("Ignoring failure of stale %1 load #%2: %3")
                             .arg(QString::fromLatin1(slotName(ticket.slot)))
                             .arg(ticket.generation)
                             .arg(error.message));
        return false;
    }

    LOG_WARN(Render, QStringLiteral("%1 load failed: %2").arg(QString::fromLatin1(slotName(ticket.slot)), error.describe()));

    if (ticket.slot == Slot::Model)
    {
        disposeModel();
        m_model.error = error;
        setLoading(Slot::Model, false);
        Q_EMIT modelChanged();
    }
    else
    {
        clearPath();
        m_path.error = error;
        m_playback.resetForPath();
        setLoading(Slot::Path, false);
        Q_EMIT pathChanged();
    }

    Q_EMIT loadFailed(ticket.slot, error.describe());
    return true;
}

void ResourceLifecycleManager::setPathProgress(double progress)
{
    if (m_pathVertices.empty())
    {
        return;
    }
    m_pathRenderer.render(m_pathVertices, progress);
    Q_EMIT pathProgressRendered(progress);
}

void ResourceLifecycleManager::teardown()
{
    // Invalidate in-flight loads so their results are disposed on arrival.
    ++m_model.generation;
    ++m_path.generation;

    disposeModel();
    clearPath();

    m_model.loading = false;
    m_path.loading = false;
}

bool ResourceLifecycleManager::isLoading(Slot slot) const noexcept
{
    return state(slot).loading;
}

const std::optional<io::LoadError>& ResourceLifecycleManager::error(Slot slot) const noexcept
{
    return state(slot).error;
}

std::uint64_t ResourceLifecycleManager::generation(Slot slot) const noexcept
{
    return state(slot).generation;
}

ResourceLifecycleManager::SlotState& ResourceLifecycleManager::state(Slot slot) noexcept
{
    return slot == Slot::Model ? static_cast<SlotState&>(m_model) : m_path;
}

const ResourceLifecycleManager::SlotState& ResourceLifecycleManager::state(Slot slot) const noexcept
{
    return slot == Slot::Model ? static_cast<const SlotState&>(m_model) : m_path;
}

void ResourceLifecycleManager::setLoading(Slot slot, bool loading)
{
    SlotState& slotState = state(slot);
    if (slotState.loading == loading)
    {
        return;
    }
    slotState.loading = loading;
    Q_EMIT loadingChanged(slot, loading);
}

void ResourceLifecycleManager::disposeModel()
{
    if (!m_model.resource)
    {
        return;
    }

    std::shared_ptr<MeshObject> previous = std::move(m_model.resource);
    m_model.resource.reset();
    m_scene.detach(previous);
    previous->dispose();
}

void ResourceLifecycleManager::clearPath()
{
    m_pathRenderer.clear();
    std::vector<QVector3D>().swap(m_pathVertices);
    m_pathStatus.reset();
    m_pathBounds = {};
}

} // namespace render
