#include "gcode/PathBuilder.h"

#include "common/log.h"

#include <algorithm>

namespace gcode
{

namespace
{
constexpr double kMinFallbackLength = 1e-3;
}

PathBuilder::PathBuilder(PathBuildOptions options)
    : m_options(options)
{
}

PathBuildResult PathBuilder::build(const std::vector<MotionCommand>& commands) const
{
    PathBuildResult result;
    result.vertices.reserve(commands.size() * 2);

    glm::dvec3 current{0.0};
    for (const MotionCommand& command : commands)
    {
        if (!command.isMotion())
        {
            continue;
        }

        glm::dvec3 target = current;
        if (command.x)
        {
            target.x = *command.x;
        }
        if (command.y)
        {
            target.y = *command.y;
        }
        if (command.z)
        {
            target.z = *command.z;
        }

        result.vertices.push_back(current);
        result.vertices.push_back(target);
        current = target;

        if (command.mode == MotionMode::Rapid)
        {
            ++result.rapidMoves;
        }
        else
        {
            ++result.linearMoves;
        }
    }

    if (result.vertices.size() >= 2)
    {
        result.status = PathStatus::Ok;
        return result;
    }

    if (!m_options.fallbackEnabled)
    {
        LOG_WARN(Gcode, "Program contains no motion commands; path left empty.");
        result.vertices.clear();
        result.status = PathStatus::Empty;
        return result;
    }

    LOG_WARN(Gcode, "Program contains no motion commands; showing the default segment.");
    result.vertices = fallbackSegment(m_options.fallbackLength);
    result.status = PathStatus::Fallback;
    return result;
}

std::vector<glm::dvec3> fallbackSegment(double length)
{
    const double half = std::max(length, kMinFallbackLength) * 0.5;
    return {glm::dvec3(-half, 0.0, 0.0), glm::dvec3(half, 0.0, 0.0)};
}

} // namespace gcode
