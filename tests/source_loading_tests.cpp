#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"

#include "common/Settings.h"
#include "gcode/DefaultProgram.h"
#include "io/EmbeddedModel.h"
#include "io/ModelImporter.h"
#include "io/ProgramLoader.h"
#include "io/SourceReader.h"
#include "render/Model.h"

#include <QtCore/QByteArray>
#include <QtCore/QDataStream>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>


namespace
{

QString writeFile(const QTemporaryDir& dir, const QString& name, const QByteArray& bytes)
{
    const QString path = dir.filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly))
    {
        file.write(bytes);
    }
    return path;
}

QByteArray embeddedStl()
{
    return QByteArray(io::kEmbeddedModelStl.data(), static_cast<qsizetype>(io::kEmbeddedModelStl.size()));
}

// Single-triangle binary STL.
QByteArray binaryTriangleStl()
{
    QByteArray bytes;
    QDataStream stream(&bytes, QIODevice::WriteOnly);
    stream.setByteOrder(QDataStream::LittleEndian);
    stream.setFloatingPointPrecision(QDataStream::SinglePrecision);

    const QByteArray header(80, '\0');
    stream.writeRawData(header.constData(), static_cast<int>(header.size()));
    stream << quint32(1);
    const float values[] = {0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 10.0f, 0.0f, 0.0f, 0.0f, 10.0f, 0.0f};
    for (float value : values)
    {
        stream << value;
    }
    stream << quint16(0);
    return bytes;
}

constexpr const char* kSquareProgram = "G21\nG90\nG0 Z5\nG0 X0 Y0\nG1 Z-1 F100\nG1 X50 F200\nG1 Y50\n";

} // namespace

DOCTEST_TEST_CASE(extension_check_is_case_insensitive)
{
    DOCTEST_CHECK(io::hasAcceptedExtension(QStringLiteral("/tmp/part.stl"), io::SourceKind::Model));
    DOCTEST_CHECK(io::hasAcceptedExtension(QStringLiteral("C:/parts/PART.STL"), io::SourceKind::Model));
    DOCTEST_CHECK(io::hasAcceptedExtension(QStringLiteral("job.GCode"), io::SourceKind::Program));

    DOCTEST_CHECK_FALSE(io::hasAcceptedExtension(QStringLiteral("part.obj"), io::SourceKind::Model));
    DOCTEST_CHECK_FALSE(io::hasAcceptedExtension(QStringLiteral("job.nc"), io::SourceKind::Program));
    DOCTEST_CHECK_FALSE(io::hasAcceptedExtension(QStringLiteral("part.stl"), io::SourceKind::Program));
    DOCTEST_CHECK_FALSE(io::hasAcceptedExtension(QStringLiteral("stl"), io::SourceKind::Model));
}

DOCTEST_TEST_CASE(command_line_files_are_sorted_by_extension)
{
    const io::CommandLineSources programOnly = io::sortCommandLineSources({QStringLiteral("job.gcode")});
    DOCTEST_CHECK(programOnly.modelPath.isEmpty());
    DOCTEST_CHECK(programOnly.programPath == QStringLiteral("job.gcode"));
    DOCTEST_CHECK(programOnly.rejected.isEmpty());

    const io::CommandLineSources swapped =
        io::sortCommandLineSources({QStringLiteral("job.GCODE"), QStringLiteral("part.Stl")});
    DOCTEST_CHECK(swapped.modelPath == QStringLiteral("part.Stl"));
    DOCTEST_CHECK(swapped.programPath == QStringLiteral("job.GCODE"));
    DOCTEST_CHECK(swapped.rejected.isEmpty());

    const io::CommandLineSources mixed = io::sortCommandLineSources(
        {QStringLiteral("part.obj"), QStringLiteral("a.stl"), QStringLiteral("b.stl"), QStringLiteral("job.nc")});
    DOCTEST_CHECK(mixed.modelPath == QStringLiteral("a.stl"));
    DOCTEST_CHECK(mixed.programPath.isEmpty());
    DOCTEST_REQUIRE(mixed.rejected.size() == 3);
    DOCTEST_CHECK(mixed.rejected.at(0) == QStringLiteral("part.obj"));
    DOCTEST_CHECK(mixed.rejected.at(1) == QStringLiteral("b.stl"));
    DOCTEST_CHECK(mixed.rejected.at(2) == QStringLiteral("job.nc"));
}

DOCTEST_TEST_CASE(default_model_decodes_the_embedded_part)
{
    const io::ModelImporter importer;
    render::Model model;
    io::LoadError error;

    DOCTEST_REQUIRE(importer.loadSource(QString(), QString(), model, error));
    DOCTEST_CHECK(model.isValid());
    DOCTEST_CHECK(model.triangleCount() == 12);
    DOCTEST_CHECK(model.name() == QString::fromLatin1(io::kEmbeddedModelName.data()));

    const common::Bounds bounds = model.bounds();
    DOCTEST_CHECK(bounds.min.x() == doctest::Approx(0.0));
    DOCTEST_CHECK(bounds.max.x() == doctest::Approx(50.0));
    DOCTEST_CHECK(bounds.max.y() == doctest::Approx(50.0));
    DOCTEST_CHECK(bounds.min.z() == doctest::Approx(-10.0));
    DOCTEST_CHECK(bounds.max.z() == doctest::Approx(0.0));
}

DOCTEST_TEST_CASE(explicit_model_files_load)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());

    const io::ModelImporter importer;
    {
        render::Model model;
        io::LoadError error;
        DOCTEST_REQUIRE(importer.load(writeFile(dir, QStringLiteral("block.STL"), embeddedStl()), model, error));
        DOCTEST_CHECK(model.triangleCount() == 12);
        DOCTEST_CHECK(model.name() == QStringLiteral("block.STL"));
    }
    {
        render::Model model;
        io::LoadError error;
        DOCTEST_REQUIRE(importer.load(writeFile(dir, QStringLiteral("tri.stl"), binaryTriangleStl()), model, error));
        DOCTEST_CHECK(model.triangleCount() == 1);
        DOCTEST_CHECK(model.bounds().max.x() == doctest::Approx(10.0));
    }
}

DOCTEST_TEST_CASE(configured_default_model_is_used_when_no_file_is_given)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString configured = writeFile(dir, QStringLiteral("tri.stl"), binaryTriangleStl());

    const io::ModelImporter importer;
    render::Model model;
    io::LoadError error;
    DOCTEST_REQUIRE(importer.loadSource(QString(), configured, model, error));
    DOCTEST_CHECK(model.triangleCount() == 1);
}

DOCTEST_TEST_CASE(missing_model_is_a_read_error)
{
    const io::ModelImporter importer;
    render::Model model;
    io::LoadError error;

    DOCTEST_CHECK_FALSE(importer.load(QStringLiteral("/nonexistent/dir/part.stl"), model, error));
    DOCTEST_CHECK(error.kind == io::LoadErrorKind::SourceRead);
    DOCTEST_CHECK(error.describe().startsWith(QStringLiteral("Failed to read file")));
    DOCTEST_CHECK_FALSE(model.isValid());
}

DOCTEST_TEST_CASE(empty_model_file_is_a_read_error)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());

    const io::ModelImporter importer;
    render::Model model;
    io::LoadError error;
    DOCTEST_CHECK_FALSE(importer.load(writeFile(dir, QStringLiteral("empty.stl"), QByteArray()), model, error));
    DOCTEST_CHECK(error.kind == io::LoadErrorKind::SourceRead);
}

DOCTEST_TEST_CASE(garbage_model_is_a_decode_error)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());

    const io::ModelImporter importer;
    render::Model model;
    io::LoadError error;
    DOCTEST_CHECK_FALSE(importer.load(writeFile(dir, QStringLiteral("junk.stl"), QByteArrayLiteral("not a mesh")), model, error));
    DOCTEST_CHECK(error.kind == io::LoadErrorKind::Decode);
    DOCTEST_CHECK(error.describe().startsWith(QStringLiteral("Failed to decode file")));
    DOCTEST_CHECK_FALSE(model.isValid());
}

DOCTEST_TEST_CASE(placement_transform_orients_scales_and_centres)
{
    common::Bounds bounds;
    bounds.expand(QVector3D{0.0f, 0.0f, 0.0f});
    bounds.expand(QVector3D{10.0f, 20.0f, 30.0f});

    common::MeshSettings placement;
    DOCTEST_CHECK(io::placementTransform(bounds, placement).isIdentity());

    placement.upAxis = common::UpAxis::Y;
    const QVector3D up = io::placementTransform(bounds, placement).map(QVector3D{0.0f, 1.0f, 0.0f});
    DOCTEST_CHECK(up.z() == doctest::Approx(1.0));
    DOCTEST_CHECK(up.y() == doctest::Approx(0.0));

    placement.upAxis = common::UpAxis::Z;
    placement.scale = 2.0;
    const QVector3D scaled = io::placementTransform(bounds, placement).map(QVector3D{10.0f, 20.0f, 30.0f});
    DOCTEST_CHECK(scaled.x() == doctest::Approx(20.0));
    DOCTEST_CHECK(scaled.z() == doctest::Approx(60.0));

    placement.centerOnOrigin = true;
    const QVector3D centre = io::placementTransform(bounds, placement).map(bounds.center());
    DOCTEST_CHECK(centre.length() == doctest::Approx(0.0));
}

DOCTEST_TEST_CASE(default_program_builds_a_path)
{
    const io::ProgramLoader loader;
    gcode::PathBuildResult result;
    io::LoadError error;

    DOCTEST_REQUIRE(loader.loadSource(QString(), QString(), result, error));
    DOCTEST_CHECK(result.status == gcode::PathStatus::Ok);
    DOCTEST_CHECK(result.vertices.size() == 28);
    DOCTEST_CHECK(result.rapidMoves == 4);
    DOCTEST_CHECK(result.linearMoves == 10);
    DOCTEST_CHECK(result.vertices.back().z == doctest::Approx(5.0));
}

DOCTEST_TEST_CASE(explicit_program_file_builds_a_path)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());

    const io::ProgramLoader loader;
    gcode::PathBuildResult result;
    io::LoadError error;

    DOCTEST_REQUIRE(loader.load(writeFile(dir, QStringLiteral("square.GCODE"), QByteArray(kSquareProgram)), result, error));
    DOCTEST_CHECK(result.status == gcode::PathStatus::Ok);
    DOCTEST_REQUIRE(result.vertices.size() == 8);
    DOCTEST_CHECK(result.vertices.back().x == doctest::Approx(50.0));
    DOCTEST_CHECK(result.vertices.back().y == doctest::Approx(50.0));
    DOCTEST_CHECK(result.vertices.back().z == doctest::Approx(-1.0));
}

DOCTEST_TEST_CASE(empty_program_file_falls_back)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());

    const io::ProgramLoader loader;
    gcode::PathBuildResult result;
    io::LoadError error;

    DOCTEST_REQUIRE(loader.load(writeFile(dir, QStringLiteral("empty.gcode"), QByteArray()), result, error));
    DOCTEST_CHECK(result.status == gcode::PathStatus::Fallback);
    DOCTEST_CHECK(result.vertices.size() == 2);

    gcode::PathBuildOptions options;
    options.fallbackEnabled = false;
    const io::ProgramLoader strict(options);
    DOCTEST_REQUIRE(strict.load(writeFile(dir, QStringLiteral("modal.gcode"), QByteArrayLiteral("G21\nG90\n")), result, error));
    DOCTEST_CHECK(result.status == gcode::PathStatus::Empty);
    DOCTEST_CHECK(result.vertices.empty());
}

DOCTEST_TEST_CASE(unreadable_programs_are_read_errors)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());

    const io::ProgramLoader loader;
    gcode::PathBuildResult result;
    io::LoadError error;

    DOCTEST_CHECK_FALSE(loader.load(dir.filePath(QStringLiteral("missing.gcode")), result, error));
    DOCTEST_CHECK(error.kind == io::LoadErrorKind::SourceRead);

    QByteArray binary("G1 X1\n");
    binary.append('\0');
    binary.append("G1 Y1\n");
    error = {};
    DOCTEST_CHECK_FALSE(loader.load(writeFile(dir, QStringLiteral("binary.gcode"), binary), result, error));
    DOCTEST_CHECK(error.kind == io::LoadErrorKind::SourceRead);

    // A directory is not a file.
    DOCTEST_CHECK_FALSE(loader.load(dir.path(), result, error));
}

DOCTEST_TEST_CASE(embedded_program_text_matches_explicit_load)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());

    const io::ProgramLoader loader;
    gcode::PathBuildResult fromDefault;
    gcode::PathBuildResult fromFile;
    io::LoadError error;

    const QByteArray text(gcode::kDefaultProgram.data(), static_cast<qsizetype>(gcode::kDefaultProgram.size()));
    DOCTEST_REQUIRE(loader.loadSource(QString(), QString(), fromDefault, error));
    DOCTEST_REQUIRE(loader.loadSource(writeFile(dir, QStringLiteral("sample.gcode"), text), QString(), fromFile, error));
    DOCTEST_CHECK(fromDefault.vertices == fromFile.vertices);
}
