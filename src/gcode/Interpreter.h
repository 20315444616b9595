#pragma once

#include "gcode/MotionCommand.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace gcode
{

struct InterpretStats
{
    std::size_t lines{0};
    std::size_t skippedLines{0}; // blank or comment-only
    std::size_t droppedLines{0}; // no G code or no coordinate
    std::size_t ignoredTokens{0};
};

// Best-effort reader for the motion subset of G-code. Unknown letters, unknown
// G values and malformed numbers are skipped; nothing here throws.
class Interpreter
{
public:
    Interpreter() = default;

    [[nodiscard]] std::vector<MotionCommand> interpret(std::string_view text);

    [[nodiscard]] const InterpretStats& stats() const noexcept { return m_stats; }

private:
    std::optional<MotionCommand> interpretLine(std::string_view line, int lineNumber);

    InterpretStats m_stats;
};

// Parses the longest numeric prefix of text. Accepts a leading sign, rejects
// non-finite results.
std::optional<double> parseNumericPrefix(std::string_view text);

} // namespace gcode
