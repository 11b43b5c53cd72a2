#ifndef FILEWARDEN_CLI_COLORS_HPP
#define FILEWARDEN_CLI_COLORS_HPP

#include <string>

namespace filewarden {
namespace colors {

/**
 * Role of a piece of shell output; each role has one ANSI style
 */
enum class Style {
    ERROR,   // Failed operations
    SUCCESS, // Generic confirmation
    INFO,    // Operation output and success messages
    HEADING, // Banner and help titles
    PROMPT,  // Input prompts
    COMMAND, // Command names in the help table
    RULE     // Underlines
};

// Colors are on unless --no-color was given or a test turned them off
void set_enabled(bool enabled);
bool enabled();

/**
 * @brief Wrap text in the escape sequence for a style
 * @param style Output role
 * @param text Text to color
 * @return Colored text, or `text` unchanged when colors are disabled
 */
std::string paint(Style style, const std::string &text);

} // namespace colors
} // namespace filewarden

#endif // FILEWARDEN_CLI_COLORS_HPP
