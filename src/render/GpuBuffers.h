#pragma once

#include "render/RenderObject.h"

#include <QtGui/QMatrix4x4>
#include <QtGui/QVector3D>
#include <QtOpenGL/QOpenGLBuffer>
#include <QtOpenGL/QOpenGLFunctions_3_3_Core>
#include <QtOpenGL/QOpenGLShaderProgram>
#include <QtOpenGL/QOpenGLVertexArrayObject>

#include <memory>
#include <vector>

namespace render
{

class Model;

// Vertex buffer for a line strip or line list. Construct and destroy with the
// owning context current.
class LineBuffer final : public GpuResource
{
public:
    explicit LineBuffer(QOpenGLFunctions_3_3_Core* functions);
    ~LineBuffer() override;

    void upload(const std::vector<QVector3D>& points);

    void draw(QOpenGLShaderProgram& program,
              const QMatrix4x4& mvp,
              const QVector3D& color,
              float alpha,
              GLenum mode = GL_LINE_STRIP,
              int first = 0,
              int count = -1);

    [[nodiscard]] bool isEmpty() const noexcept { return m_vertexCount == 0; }

private:
    QOpenGLFunctions_3_3_Core* m_functions{nullptr};
    std::unique_ptr<QOpenGLBuffer> m_buffer;
    std::unique_ptr<QOpenGLVertexArrayObject> m_vao;
    int m_vertexCount{0};
};

class MeshBuffer final : public GpuResource
{
public:
    explicit MeshBuffer(QOpenGLFunctions_3_3_Core* functions);
    ~MeshBuffer() override;

    void upload(const Model& model);

    void draw(QOpenGLShaderProgram& program,
              const QMatrix4x4& model,
              const QMatrix4x4& view,
              const QMatrix4x4& projection,
              const QVector3D& color);

    [[nodiscard]] bool isEmpty() const noexcept { return m_indexCount == 0; }

private:
    QOpenGLFunctions_3_3_Core* m_functions{nullptr};
    std::unique_ptr<QOpenGLBuffer> m_vertexBuffer;
    std::unique_ptr<QOpenGLBuffer> m_indexBuffer;
    std::unique_ptr<QOpenGLVertexArrayObject> m_vao;
    int m_indexCount{0};
};

} // namespace render
