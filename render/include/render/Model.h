#pragma once

#include "common/math.h"

#include <QtCore/QString>
#include <QtGui/QMatrix4x4>
#include <QtGui/QVector3D>

#include <cstddef>
#include <vector>

namespace render
{

struct Vertex
{
    QVector3D position;
    QVector3D normal;
};

// Triangle mesh decoded from a part file, in scene coordinates once placed.
class Model
{
public:
    using Index = quint32;

    Model() = default;

    void setName(QString name);
    [[nodiscard]] const QString& name() const;

    void setMeshData(std::vector<Vertex> vertices, std::vector<Index> indices);

    [[nodiscard]] const std::vector<Vertex>& vertices() const;
    [[nodiscard]] const std::vector<Index>& indices() const;
    [[nodiscard]] std::size_t triangleCount() const noexcept { return m_indices.size() / 3; }
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] common::Bounds bounds() const;

    // Bakes the transform into positions and normals.
    void transform(const QMatrix4x4& matrix);

private:
    QString m_name;
    std::vector<Vertex> m_vertices;
    std::vector<Index> m_indices;
};

} // namespace render
