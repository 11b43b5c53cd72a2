#ifndef FILEWARDEN_CLI_COMMAND_HPP
#define FILEWARDEN_CLI_COMMAND_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace filewarden {
namespace cli {

/**
 * Commands accepted at the prompt
 */
enum class Command {
    LIST,
    COPY,
    MOVE,
    DELETE,
    RENAME,
    MKDIR,
    RMDIR,
    EXT,
    BULK_EXT,
    CREATE,
    SIZE,
    CLEAN,
    HELP,
    EXIT
};

/**
 * Parse a command token; case and surrounding whitespace are ignored
 *
 * @param token Text typed at the prompt
 * @return The command, or std::nullopt if the token is unknown
 */
std::optional<Command> parse_command(const std::string &token);

/**
 * @return The token that selects `command`
 */
std::string command_name(Command command);

/**
 * @return (command, description) for every command, in help order
 */
const std::vector<std::pair<Command, std::string>> &command_descriptions();

/**
 * Interpret a y/n answer: "y" and "yes" in any case mean yes
 */
bool is_affirmative(const std::string &answer);

/**
 * Split a comma-separated list, trimming each item and dropping blanks
 */
std::vector<std::string> split_list(const std::string &text);

} // namespace cli
} // namespace filewarden

#endif // FILEWARDEN_CLI_COMMAND_HPP
