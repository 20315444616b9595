#pragma once

#include <optional>
#include <string>

namespace gcode
{

enum class MotionMode
{
    Rapid,
    Linear,
    Other
};

constexpr const char* motionModeName(MotionMode mode)
{
    switch (mode)
    {
    case MotionMode::Rapid: return "rapid";
    case MotionMode::Linear: return "linear";
    case MotionMode::Other: return "other";
    }
    return "unknown";
}

struct MotionCommand
{
    MotionMode mode{MotionMode::Other};
    std::string code; // literal text of the last G token, e.g. "G01"
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> z;
    int line{0}; // 1-based source line

    [[nodiscard]] bool hasCoordinate() const noexcept
    {
        return x.has_value() || y.has_value() || z.has_value();
    }

    [[nodiscard]] bool isMotion() const noexcept
    {
        return mode == MotionMode::Rapid || mode == MotionMode::Linear;
    }
};

} // namespace gcode
