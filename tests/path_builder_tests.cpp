#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"

#include "gcode/Interpreter.h"
#include "gcode/PathBuilder.h"

#include <glm/vec3.hpp>

#include <optional>
#include <vector>

namespace
{

gcode::MotionCommand linear(std::optional<double> x, std::optional<double> y, std::optional<double> z)
{
    gcode::MotionCommand command;
    command.mode = gcode::MotionMode::Linear;
    command.code = "G1";
    command.x = x;
    command.y = y;
    command.z = z;
    return command;
}

void checkVertex(const glm::dvec3& actual, double x, double y, double z)
{
    DOCTEST_CHECK(actual.x == doctest::Approx(x));
    DOCTEST_CHECK(actual.y == doctest::Approx(y));
    DOCTEST_CHECK(actual.z == doctest::Approx(z));
}

} // namespace

DOCTEST_TEST_CASE(absent_axes_carry_over_from_previous_target)
{
    const std::vector<gcode::MotionCommand> commands = {
        linear(10.0, std::nullopt, std::nullopt),
        linear(std::nullopt, 5.0, std::nullopt),
    };

    const gcode::PathBuildResult result = gcode::PathBuilder().build(commands);

    DOCTEST_CHECK(result.status == gcode::PathStatus::Ok);
    DOCTEST_REQUIRE(result.vertices.size() == 4);
    checkVertex(result.vertices[0], 0.0, 0.0, 0.0);
    checkVertex(result.vertices[1], 10.0, 0.0, 0.0);
    checkVertex(result.vertices[2], 10.0, 0.0, 0.0);
    checkVertex(result.vertices[3], 10.0, 5.0, 0.0);
    DOCTEST_CHECK(result.linearMoves == 2);
    DOCTEST_CHECK(result.rapidMoves == 0);
}

DOCTEST_TEST_CASE(square_program_ends_at_last_corner)
{
    gcode::Interpreter interpreter;
    const auto commands = interpreter.interpret("G21\nG90\nG0 Z5\nG0 X0 Y0\nG1 Z-1 F100\nG1 X50 F200\nG1 Y50\n");
    const gcode::PathBuildResult result = gcode::PathBuilder().build(commands);

    DOCTEST_CHECK(result.status == gcode::PathStatus::Ok);
    DOCTEST_REQUIRE(result.vertices.size() == 8);
    checkVertex(result.vertices.front(), 0.0, 0.0, 0.0);
    checkVertex(result.vertices[1], 0.0, 0.0, 5.0);
    checkVertex(result.vertices.back(), 50.0, 50.0, -1.0);
    DOCTEST_CHECK(result.rapidMoves == 2);
    DOCTEST_CHECK(result.linearMoves == 2);
}

DOCTEST_TEST_CASE(consecutive_segments_share_endpoints)
{
    gcode::Interpreter interpreter;
    const auto commands = interpreter.interpret("G0 X1 Y2 Z3\nG1 X4\nG1 Y-6\nG0 Z10\nG1 X0 Y0 Z0\n");
    const gcode::PathBuildResult result = gcode::PathBuilder().build(commands);

    DOCTEST_REQUIRE(result.vertices.size() % 2 == 0);
    for (std::size_t i = 2; i < result.vertices.size(); i += 2)
    {
        DOCTEST_CHECK(result.vertices[i] == result.vertices[i - 1]);
    }
}

DOCTEST_TEST_CASE(other_commands_do_not_move_the_tool)
{
    gcode::Interpreter interpreter;
    const auto commands = interpreter.interpret("G1 X5\nG92 X0\nG1 Y5\n");
    const gcode::PathBuildResult result = gcode::PathBuilder().build(commands);

    DOCTEST_REQUIRE(result.vertices.size() == 4);
    checkVertex(result.vertices[2], 5.0, 0.0, 0.0);
    checkVertex(result.vertices[3], 5.0, 5.0, 0.0);
}

DOCTEST_TEST_CASE(no_motion_yields_fallback_segment)
{
    gcode::Interpreter interpreter;
    const auto commands = interpreter.interpret("; only comments\nG21\nG90\nG92 X0\n");
    const gcode::PathBuildResult result = gcode::PathBuilder().build(commands);

    DOCTEST_CHECK(result.status == gcode::PathStatus::Fallback);
    DOCTEST_REQUIRE(result.vertices.size() == 2);
    checkVertex(result.vertices[0], -0.5, 0.0, 0.0);
    checkVertex(result.vertices[1], 0.5, 0.0, 0.0);
}

DOCTEST_TEST_CASE(fallback_can_be_disabled)
{
    gcode::PathBuildOptions options;
    options.fallbackEnabled = false;

    const gcode::PathBuildResult result = gcode::PathBuilder(options).build({});

    DOCTEST_CHECK(result.status == gcode::PathStatus::Empty);
    DOCTEST_CHECK(result.empty());
}

DOCTEST_TEST_CASE(fallback_length_is_configurable)
{
    gcode::PathBuildOptions options;
    options.fallbackLength = 20.0;

    const gcode::PathBuildResult result = gcode::PathBuilder(options).build({});

    DOCTEST_REQUIRE(result.vertices.size() == 2);
    checkVertex(result.vertices[0], -10.0, 0.0, 0.0);
    checkVertex(result.vertices[1], 10.0, 0.0, 0.0);

    const auto tiny = gcode::fallbackSegment(0.0);
    DOCTEST_CHECK(tiny[1].x - tiny[0].x > 0.0);
}
