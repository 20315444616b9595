#include "gcode/Interpreter.h"

#include "common/log.h"

#include <QtCore/QString>

#include <cctype>
#include <charconv>
#include <cmath>

namespace gcode
{

namespace
{

constexpr char kCommentMarker = ';';

bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text)
{
    while (!text.empty() && isSpace(text.front()))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back()))
    {
        text.remove_suffix(1);
    }
    return text;
}

std::string_view stripComment(std::string_view line)
{
    const std::size_t marker = line.find(kCommentMarker);
    return marker == std::string_view::npos ? line : line.substr(0, marker);
}

char upper(char c)
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

// G0/G00/G0.1 map to rapid, G1/G01/G10 to linear: the mode follows the first
// digit after the letter.
MotionMode motionModeForToken(std::string_view token)
{
    if (token.size() < 2)
    {
        return MotionMode::Other;
    }
    switch (token[1])
    {
    case '0': return MotionMode::Rapid;
    case '1': return MotionMode::Linear;
    default: return MotionMode::Other;
    }
}

} // namespace

std::optional<double> parseNumericPrefix(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }

    // from_chars rejects an explicit plus sign.
    if (text.front() == '+')
    {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-' || text.front() == '+')
        {
            return std::nullopt;
        }
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr == text.data() || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

std::vector<MotionCommand> Interpreter::interpret(std::string_view text)
{
    m_stats = {};
    std::vector<MotionCommand> commands;

    int lineNumber = 0;
    std::size_t start = 0;
    while (start <= text.size())
    {
        const std::size_t end = text.find('\n', start);
        const std::string_view rawLine = (end == std::string_view::npos) ? text.substr(start)
                                                                          : text.substr(start, end - start);
        ++lineNumber;
        ++m_stats.lines;

        if (std::optional<MotionCommand> command = interpretLine(rawLine, lineNumber))
        {
            commands.push_back(std::move(*command));
        }

        if (end == std::string_view::npos)
        {
            break;
        }
        start = end + 1;
    }

    LOG_DEBUG(Gcode,
              QStringLiteral("Interpreted %1 lines: %2 commands, %3 skipped, %4 dropped, %5 ignored tokens.")
                  .arg(m_stats.lines)
                  .arg(commands.size())
                  .arg(m_stats.skippedLines)
                  .arg(m_stats.droppedLines)
                  .arg(m_stats.ignoredTokens));
    return commands;
}

std::optional<MotionCommand> Interpreter::interpretLine(std::string_view line, int lineNumber)
{
    const std::string_view trimmed = trim(line);
    if (trimmed.empty() || trimmed.front() == kCommentMarker)
    {
        ++m_stats.skippedLines;
        return std::nullopt;
    }

    const std::string_view content = stripComment(trimmed);

    MotionCommand command;
    command.line = lineNumber;
    bool hasGCode = false;

    std::size_t pos = 0;
    while (pos < content.size())
    {
        while (pos < content.size() && isSpace(content[pos]))
        {
            ++pos;
        }
        const std::size_t tokenStart = pos;
        while (pos < content.size() && !isSpace(content[pos]))
        {
            ++pos;
        }
        if (tokenStart == pos)
        {
            break;
        }

        const std::string_view token = content.substr(tokenStart, pos - tokenStart);
        const char letter = upper(token.front());

        if (letter == 'G')
        {
            hasGCode = true;
            command.code.assign(token.begin(), token.end());
            command.code.front() = 'G';
            // The last G word on a line decides the mode.
            command.mode = motionModeForToken(token);
            continue;
        }

        if (letter != 'X' && letter != 'Y' && letter != 'Z')
        {
            ++m_stats.ignoredTokens;
            continue;
        }

        const std::optional<double> value = parseNumericPrefix(token.substr(1));
        if (!value)
        {
            ++m_stats.ignoredTokens;
            continue;
        }

        switch (letter)
        {
        case 'X': command.x = value; break;
        case 'Y': command.y = value; break;
        case 'Z': command.z = value; break;
        default: break;
        }
    }

    if (!hasGCode || !command.hasCoordinate())
    {
        ++m_stats.droppedLines;
        return std::nullopt;
    }
    return command;
}

} // namespace gcode
