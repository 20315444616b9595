#include "io/ModelImporter.h"

#include "common/Enforce.h"
#include "common/log.h"
#include "io/EmbeddedModel.h"
#include "io/SourceReader.h"

#include <assimp/Importer.hpp>
#include <assimp/postprocess.h>
#include <assimp/scene.h>

#include <QtCore/QFileInfo>

#include <utility>
#include <vector>

namespace io
{

namespace
{

constexpr unsigned int kPostProcessFlags =
    aiProcess_Triangulate |
    aiProcess_JoinIdenticalVertices |
    aiProcess_GenSmoothNormals |
    aiProcess_RemoveRedundantMaterials |
    aiProcess_PreTransformVertices |
    aiProcess_SortByPType;

constexpr qint64 kMaxFileSizeBytes = 200 * 1024ll * 1024ll; // 200 MB
constexpr std::size_t kMaxTriangleCount = 5'000'000;
constexpr const char* kFormatHint = "stl";

render::Vertex makeVertex(const aiMesh* mesh, unsigned int index)
{
    render::Vertex vertex;
    const aiVector3D& position = mesh->mVertices[index];
    vertex.position = {position.x, position.y, position.z};

    if (mesh->HasNormals())
    {
        const aiVector3D& normal = mesh->mNormals[index];
        vertex.normal = {normal.x, normal.y, normal.z};
    }
    else
    {
        vertex.normal = {0.0f, 0.0f, 1.0f};
    }

    return vertex;
}

} // namespace

ModelImporter::ModelImporter(common::MeshSettings placement)
    : m_placement(placement)
{
}

bool ModelImporter::loadSource(const QString& path,
                               const QString& configuredDefault,
                               render::Model& outModel,
                               LoadError& error) const
{
    if (!path.isEmpty())
    {
        return load(path, outModel, error);
    }
    if (!configuredDefault.isEmpty())
    {
        return load(configuredDefault, outModel, error);
    }

    const QByteArray embedded = QByteArray::fromRawData(kEmbeddedModelStl.data(),
                                                        static_cast<qsizetype>(kEmbeddedModelStl.size()));
    return decode(embedded, QString::fromLatin1(kEmbeddedModelName.data(), static_cast<qsizetype>(kEmbeddedModelName.size())),
                  outModel, error);
}

bool ModelImporter::load(const QString& path, render::Model& outModel, LoadError& error) const
{
    QByteArray bytes;
    if (!readSourceBytes(path, kMaxFileSizeBytes, false, bytes, error))
    {
        return false;
    }
    return decode(bytes, QFileInfo(path).fileName(), outModel, error);
}

bool ModelImporter::decode(const QByteArray& bytes,
                           const QString& name,
                           render::Model& outModel,
                           LoadError& error) const
{
    ENFORCE(!outModel.isValid(), "Destination model must be empty before import.");

    if (bytes.isEmpty())
    {
        error = {LoadErrorKind::SourceRead, QStringLiteral("No data to decode.")};
        return false;
    }

    Assimp::Importer importer;
    importer.SetPropertyInteger(AI_CONFIG_PP_SBP_REMOVE, aiPrimitiveType_POINT | aiPrimitiveType_LINE);
    importer.SetPropertyBool(AI_CONFIG_PP_PTV_KEEP_HIERARCHY, false);

    const aiScene* scene = importer.ReadFileFromMemory(bytes.constData(),
                                                       static_cast<std::size_t>(bytes.size()),
                                                       kPostProcessFlags,
                                                       kFormatHint);
    if (!scene || !scene->HasMeshes())
    {
        QString reason = QString::fromUtf8(importer.GetErrorString());
        if (reason.isEmpty())
        {
            reason = QStringLiteral("Failed to load STL data.");
        }
        error = {LoadErrorKind::Decode, reason};
        return false;
    }

    std::size_t estimatedVertexCount = 0;
    std::size_t triangleCount = 0;
    for (unsigned int meshIndex = 0; meshIndex < scene->mNumMeshes; ++meshIndex)
    {
        const aiMesh* mesh = scene->mMeshes[meshIndex];
        if (mesh)
        {
            estimatedVertexCount += mesh->mNumVertices;
            triangleCount += mesh->mNumFaces;
        }
    }
    if (triangleCount > kMaxTriangleCount)
    {
        error = {LoadErrorKind::Decode, QStringLiteral("Mesh exceeds triangle safety limit (5M faces).")};
        return false;
    }

    std::vector<render::Vertex> vertices;
    std::vector<render::Model::Index> indices;
    vertices.reserve(estimatedVertexCount);
    indices.reserve(triangleCount * 3);

    for (unsigned int meshIndex = 0; meshIndex < scene->mNumMeshes; ++meshIndex)
    {
        const aiMesh* mesh = scene->mMeshes[meshIndex];
        if (!mesh || mesh->mNumVertices == 0 || mesh->mNumFaces == 0)
        {
            continue;
        }

        const auto baseIndex = static_cast<render::Model::Index>(vertices.size());

        for (unsigned int v = 0; v < mesh->mNumVertices; ++v)
        {
            vertices.push_back(makeVertex(mesh, v));
        }

        for (unsigned int f = 0; f < mesh->mNumFaces; ++f)
        {
            const aiFace& face = mesh->mFaces[f];
            if (face.mNumIndices < 3)
            {
                continue;
            }

            indices.push_back(baseIndex + static_cast<render::Model::Index>(face.mIndices[0]));
            indices.push_back(baseIndex + static_cast<render::Model::Index>(face.mIndices[1]));
            indices.push_back(baseIndex + static_cast<render::Model::Index>(face.mIndices[2]));
        }
    }

    if (vertices.empty() || indices.empty())
    {
        error = {LoadErrorKind::Decode, QStringLiteral("No triangle data found in file.")};
        return false;
    }

    outModel.setName(name);
    outModel.setMeshData(std::move(vertices), std::move(indices));
    outModel.transform(placementTransform(outModel.bounds(), m_placement));

    LOG_INFO(Io, QStringLiteral("Decoded %1: %2 triangles.").arg(name).arg(outModel.triangleCount()));
    return true;
}

QMatrix4x4 placementTransform(const common::Bounds& bounds, const common::MeshSettings& placement)
{
    QMatrix4x4 orient;
    if (placement.upAxis == common::UpAxis::Y)
    {
        orient.rotate(90.0f, 1.0f, 0.0f, 0.0f);
    }
    orient.scale(static_cast<float>(placement.scale));

    if (!placement.centerOnOrigin || !bounds.valid)
    {
        return orient;
    }

    // Centre of the oriented box; the transform is affine so mapping the
    // source centre is enough.
    const QVector3D center = orient.map(bounds.center());
    QMatrix4x4 result;
    result.translate(-center);
    return result * orient;
}

} // namespace io
