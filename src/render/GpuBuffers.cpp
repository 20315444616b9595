#include "render/GpuBuffers.h"

#include "render/Model.h"

#include <algorithm>
#include <cstddef>

namespace render
{

namespace
{
const QVector3D kLightDirection = QVector3D{0.3f, 0.4f, 0.9f}.normalized();
}

LineBuffer::LineBuffer(QOpenGLFunctions_3_3_Core* functions)
    : m_functions(functions)
    , m_buffer(std::make_unique<QOpenGLBuffer>(QOpenGLBuffer::VertexBuffer))
    , m_vao(std::make_unique<QOpenGLVertexArrayObject>())
{
    m_buffer->create();
    m_vao->create();
}

LineBuffer::~LineBuffer()
{
    m_buffer->destroy();
    m_vao->destroy();
}

void LineBuffer::upload(const std::vector<QVector3D>& points)
{
    m_vao->bind();
    m_buffer->bind();

    if (!points.empty())
    {
        m_buffer->allocate(points.data(), static_cast<int>(points.size() * sizeof(QVector3D)));
    }
    else
    {
        m_buffer->allocate(nullptr, 0);
    }

    m_functions->glEnableVertexAttribArray(0);
    m_functions->glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(QVector3D), nullptr);

    m_buffer->release();
    m_vao->release();

    m_vertexCount = static_cast<int>(points.size());
}

void LineBuffer::draw(QOpenGLShaderProgram& program,
                      const QMatrix4x4& mvp,
                      const QVector3D& color,
                      float alpha,
                      GLenum mode,
                      int first,
                      int count)
{
    const int available = m_vertexCount - std::max(0, first);
    const int drawCount = count < 0 ? available : std::min(count, available);
    if (drawCount < 2)
    {
        return;
    }

    program.bind();
    program.setUniformValue("u_mvp", mvp);
    program.setUniformValue("u_color", color);
    program.setUniformValue("u_alpha", alpha);

    m_vao->bind();
    m_functions->glDrawArrays(mode, std::max(0, first), drawCount);
    m_vao->release();
    program.release();
}

MeshBuffer::MeshBuffer(QOpenGLFunctions_3_3_Core* functions)
    : m_functions(functions)
    , m_vertexBuffer(std::make_unique<QOpenGLBuffer>(QOpenGLBuffer::VertexBuffer))
    , m_indexBuffer(std::make_unique<QOpenGLBuffer>(QOpenGLBuffer::IndexBuffer))
    , m_vao(std::make_unique<QOpenGLVertexArrayObject>())
{
    m_vertexBuffer->create();
    m_indexBuffer->create();
    m_vao->create();
}

MeshBuffer::~MeshBuffer()
{
    m_vertexBuffer->destroy();
    m_indexBuffer->destroy();
    m_vao->destroy();
}

void MeshBuffer::upload(const Model& model)
{
    const auto& vertices = model.vertices();
    const auto& indices = model.indices();

    m_vao->bind();

    m_vertexBuffer->bind();
    m_vertexBuffer->allocate(vertices.data(), static_cast<int>(vertices.size() * sizeof(Vertex)));

    m_functions->glEnableVertexAttribArray(0);
    m_functions->glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(Vertex),
                                       reinterpret_cast<void*>(offsetof(Vertex, position)));
    m_functions->glEnableVertexAttribArray(1);
    m_functions->glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(Vertex),
                                       reinterpret_cast<void*>(offsetof(Vertex, normal)));

    m_indexBuffer->bind();
    m_indexBuffer->allocate(indices.data(), static_cast<int>(indices.size() * sizeof(Model::Index)));

    m_vao->release();
    m_vertexBuffer->release();
    m_indexBuffer->release();

    m_indexCount = static_cast<int>(indices.size());
}

void MeshBuffer::draw(QOpenGLShaderProgram& program,
                      const QMatrix4x4& model,
                      const QMatrix4x4& view,
                      const QMatrix4x4& projection,
                      const QVector3D& color)
{
    if (m_indexCount == 0)
    {
        return;
    }

    program.bind();
    program.setUniformValue("u_model", model);
    program.setUniformValue("u_view", view);
    program.setUniformValue("u_projection", projection);
    program.setUniformValue("u_lightDir", kLightDirection);
    program.setUniformValue("u_color", color);

    m_vao->bind();
    m_functions->glDrawElements(GL_TRIANGLES, m_indexCount, GL_UNSIGNED_INT, nullptr);
    m_vao->release();
    program.release();
}

} // namespace render
