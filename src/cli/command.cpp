#include "cli/command.hpp"
#include "common/file_operations.hpp"

#include <sstream>
#include <unordered_map>

namespace filewarden {
namespace cli {

namespace {
const std::unordered_map<std::string, Command> command_map = {
    {"list", Command::LIST},
    {"copy", Command::COPY},
    {"move", Command::MOVE},
    {"delete", Command::DELETE},
    {"rename", Command::RENAME},
    {"mkdir", Command::MKDIR},
    {"rmdir", Command::RMDIR},
    {"ext", Command::EXT},
    {"bulk_ext", Command::BULK_EXT},
    {"create", Command::CREATE},
    {"size", Command::SIZE},
    {"clean", Command::CLEAN},
    {"help", Command::HELP},
    {"exit", Command::EXIT}};
} // namespace

std::optional<Command> parse_command(const std::string &token)
{
    auto it = command_map.find(common::to_lower(common::trim(token)));
    if (it == command_map.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string command_name(Command command)
{
    switch (command) {
    case Command::LIST:
        return "list";
    case Command::COPY:
        return "copy";
    case Command::MOVE:
        return "move";
    case Command::DELETE:
        return "delete";
    case Command::RENAME:
        return "rename";
    case Command::MKDIR:
        return "mkdir";
    case Command::RMDIR:
        return "rmdir";
    case Command::EXT:
        return "ext";
    case Command::BULK_EXT:
        return "bulk_ext";
    case Command::CREATE:
        return "create";
    case Command::SIZE:
        return "size";
    case Command::CLEAN:
        return "clean";
    case Command::HELP:
        return "help";
    case Command::EXIT:
        return "exit";
    }
    return "unknown";
}

const std::vector<std::pair<Command, std::string>> &command_descriptions()
{
    static const std::vector<std::pair<Command, std::string>> descriptions = {
        {Command::LIST, "List directory contents"},
        {Command::COPY, "Copy a file"},
        {Command::MOVE, "Move a file"},
        {Command::DELETE, "Delete a file"},
        {Command::RENAME, "Rename a file"},
        {Command::MKDIR, "Create a directory"},
        {Command::RMDIR, "Delete a directory"},
        {Command::EXT, "Change a file's extension"},
        {Command::BULK_EXT, "Bulk change file extensions"},
        {Command::CREATE, "Create an empty file"},
        {Command::SIZE, "Get directory size"},
        {Command::CLEAN, "Clean directory contents"},
        {Command::HELP, "Show this help"},
        {Command::EXIT, "Exit the program"}};
    return descriptions;
}

bool is_affirmative(const std::string &answer)
{
    const std::string lowered = common::to_lower(common::trim(answer));
    return lowered == "y" || lowered == "yes";
}

std::vector<std::string> split_list(const std::string &text)
{
    std::vector<std::string> items;
    std::istringstream stream(text);
    std::string item;

    while (std::getline(stream, item, ',')) {
        item = common::trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }

    return items;
}

} // namespace cli
} // namespace filewarden
