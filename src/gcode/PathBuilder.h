#pragma once

#include "gcode/MotionCommand.h"

#include <glm/vec3.hpp>

#include <vector>

namespace gcode
{

enum class PathStatus
{
    Ok,       // at least one motion command produced geometry
    Fallback, // no motion geometry; vertices hold the default segment
    Empty     // no motion geometry and the fallback is disabled
};

constexpr const char* pathStatusName(PathStatus status)
{
    switch (status)
    {
    case PathStatus::Ok: return "ok";
    case PathStatus::Fallback: return "fallback";
    case PathStatus::Empty: return "empty";
    }
    return "unknown";
}

struct PathBuildOptions
{
    bool fallbackEnabled{true};
    double fallbackLength{1.0};
};

// Flattened trajectory: vertices[2k] and vertices[2k + 1] are the start and end
// of the k-th move.
struct PathBuildResult
{
    std::vector<glm::dvec3> vertices;
    PathStatus status{PathStatus::Empty};
    std::size_t rapidMoves{0};
    std::size_t linearMoves{0};

    [[nodiscard]] bool empty() const noexcept { return vertices.empty(); }
};

class PathBuilder
{
public:
    PathBuilder() = default;
    explicit PathBuilder(PathBuildOptions options);

    [[nodiscard]] PathBuildResult build(const std::vector<MotionCommand>& commands) const;

private:
    PathBuildOptions m_options;
};

std::vector<glm::dvec3> fallbackSegment(double length);

} // namespace gcode
