#pragma once

#include <string_view>

namespace gcode
{

inline constexpr std::string_view kDefaultProgramName = "embedded_square_pocket.gcode";

// Shown when no program file is selected: a 50 mm square profile cut 1 mm deep,
// followed by a second pass at 2 mm.
inline constexpr std::string_view kDefaultProgram = R"(; embedded sample program
G21
G90
G0 Z5
G0 X0 Y0
G1 Z-1 F100
G1 X50 F200
G1 Y50
G1 X0
G1 Y0
G0 Z5
G1 Z-2 F100
G1 X50 F200
G1 Y50
G1 X0
G1 Y0
G0 Z5
M5
M2
)";

} // namespace gcode
