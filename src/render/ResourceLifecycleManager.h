#pragma once

#include "common/math.h"
#include "gcode/PathBuilder.h"
#include "io/LoadError.h"
#include "render/PartialPathRenderer.h"
#include "render/RenderObject.h"

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtGui/QVector3D>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace render
{

class PlaybackController;
class Scene;

enum class Slot
{
    Model,
    Path
};

const char* slotName(Slot slot);

// Identifies one asynchronous load. Only the ticket carrying the slot's current
// generation may install a result.
struct LoadTicket
{
    Slot slot{Slot::Model};
    std::uint64_t generation{0};
};

// Single owner of the displayed part mesh and path line. Superseded load
// results are disposed instead of installed.
class ResourceLifecycleManager : public QObject
{
    Q_OBJECT

public:
    ResourceLifecycleManager(Scene& scene, PlaybackController& playback, QObject* parent = nullptr);
    ~ResourceLifecycleManager() override;

    [[nodiscard]] LoadTicket beginLoad(Slot slot);
    [[nodiscard]] bool isCurrent(const LoadTicket& ticket) const noexcept;

    // Each returns true when the result was installed, false when it was stale.
    bool completeModelLoad(const LoadTicket& ticket, std::shared_ptr<MeshObject> mesh);
    bool completePathLoad(const LoadTicket& ticket, gcode::PathBuildResult result);
    bool failLoad(const LoadTicket& ticket, const io::LoadError& error);

    void setPathProgress(double progress);

    void teardown();

    [[nodiscard]] const std::shared_ptr<MeshObject>& activeModel() const noexcept { return m_model.resource; }
    [[nodiscard]] const std::shared_ptr<PathLine>& activePath() const noexcept { return m_pathRenderer.current(); }
    [[nodiscard]] const std::vector<QVector3D>& pathVertices() const noexcept { return m_pathVertices; }
    [[nodiscard]] std::optional<gcode::PathStatus> pathStatus() const noexcept { return m_pathStatus; }
    [[nodiscard]] common::Bounds pathBounds() const { return m_pathBounds; }
    [[nodiscard]] std::optional<QVector3D> toolPosition() const { return m_pathRenderer.toolPosition(); }

    [[nodiscard]] bool isLoading(Slot slot) const noexcept;
    [[nodiscard]] const std::optional<io::LoadError>& error(Slot slot) const noexcept;
    [[nodiscard]] std::uint64_t generation(Slot slot) const noexcept;

Q_SIGNALS:
    void modelChanged();
    void pathChanged();
    void pathProgressRendered(double progress);
    void loadingChanged(render::Slot slot, bool loading);
    void loadFailed(render::Slot slot, const QString& message);

private:
    struct SlotState
    {
        std::uint64_t generation{0};
        bool loading{false};
        std::optional<io::LoadError> error;
    };

    struct ModelSlot : SlotState
    {
        std::shared_ptr<MeshObject> resource;
    };

    SlotState& state(Slot slot) noexcept;
    const SlotState& state(Slot slot) const noexcept;

    void setLoading(Slot slot, bool loading);
    void disposeModel();
    void clearPath();

    Scene& m_scene;
    PlaybackController& m_playback;
    PartialPathRenderer m_pathRenderer;

    ModelSlot m_model;
    SlotState m_path;
    std::vector<QVector3D> m_pathVertices;
    std::optional<gcode::PathStatus> m_pathStatus;
    common::Bounds m_pathBounds;
};

} // namespace render

Q_DECLARE_METATYPE(render::Slot)
