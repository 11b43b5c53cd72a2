#include "cli/colors.hpp"

namespace filewarden {
namespace colors {

namespace {
bool colors_enabled = true;

constexpr const char *RESET = "\033[0m";

const char *escape_for(Style style)
{
    switch (style) {
    case Style::ERROR:
        return "\033[31m";
    case Style::SUCCESS:
        return "\033[32m";
    case Style::INFO:
    case Style::RULE:
        return "\033[36m";
    case Style::HEADING:
        return "\033[1;35m";
    case Style::PROMPT:
        return "\033[1;36m";
    case Style::COMMAND:
        return "\033[1;32m";
    }
    return "";
}
} // namespace

void set_enabled(bool enabled)
{
    colors_enabled = enabled;
}

bool enabled()
{
    return colors_enabled;
}

std::string paint(Style style, const std::string &text)
{
    if (!colors_enabled) {
        return text;
    }
    return escape_for(style) + text + RESET;
}

} // namespace colors
} // namespace filewarden
