#pragma once

#include "common/Settings.h"
#include "io/LoadError.h"
#include "render/Model.h"

#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace io
{

// Mesh decoding goes through Assimp; this class only frames the bytes, applies
// the safety limits and places the result in the scene.
class ModelImporter
{
public:
    ModelImporter() = default;
    explicit ModelImporter(common::MeshSettings placement);

    // An empty path selects configuredDefault, or the embedded part when that is empty too.
    bool loadSource(const QString& path,
                    const QString& configuredDefault,
                    render::Model& outModel,
                    LoadError& error) const;

    bool load(const QString& path, render::Model& outModel, LoadError& error) const;

    bool decode(const QByteArray& bytes,
                const QString& name,
                render::Model& outModel,
                LoadError& error) const;

private:
    common::MeshSettings m_placement;
};

QMatrix4x4 placementTransform(const common::Bounds& bounds, const common::MeshSettings& placement);

} // namespace io
