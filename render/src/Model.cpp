#include "render/Model.h"

#include <utility>

namespace render
{

void Model::setName(QString name)
{
    m_name = std::move(name);
}

const QString& Model::name() const
{
    return m_name;
}

void Model::setMeshData(std::vector<Vertex> vertices, std::vector<Model::Index> indices)
{
    m_vertices = std::move(vertices);
    m_indices = std::move(indices);
}

const std::vector<Vertex>& Model::vertices() const
{
    return m_vertices;
}

const std::vector<Model::Index>& Model::indices() const
{
    return m_indices;
}

bool Model::isValid() const
{
    return !m_vertices.empty() && m_indices.size() >= 3;
}

common::Bounds Model::bounds() const
{
    common::Bounds result;
    for (const Vertex& vertex : m_vertices)
    {
        result.expand(vertex.position);
    }
    return result;
}

void Model::transform(const QMatrix4x4& matrix)
{
    for (Vertex& vertex : m_vertices)
    {
        vertex.position = matrix.map(vertex.position);
        const QVector3D normal = matrix.mapVector(vertex.normal);
        vertex.normal = normal.lengthSquared() > 0.0f ? normal.normalized() : QVector3D{0.0f, 0.0f, 1.0f};
    }
}

} // namespace render
