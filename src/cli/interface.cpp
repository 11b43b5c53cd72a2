#include "cli/interface.hpp"
#include "cli/colors.hpp"
#include "cli/command.hpp"
#include <algorithm>
#include <iostream>

namespace filewarden {
namespace cli {

namespace {
constexpr int BANNER_WIDTH = 50;
}

TUI::TUI() : m_input(std::cin), m_output(std::cout) {}

TUI::TUI(std::istream &input, std::ostream &output)
    : m_input(input), m_output(output)
{
}

std::optional<std::string> TUI::read_line(const std::string &prompt)
{
    m_output << colors::paint(colors::Style::PROMPT, prompt) << std::flush;

    std::string input;
    if (!std::getline(m_input, input)) {
        m_output << std::endl;
        return std::nullopt;
    }

    return input;
}

void TUI::display_result(bool success, const std::string &result)
{
    if (!success) {
        m_output << colors::paint(colors::Style::ERROR, result) << std::endl;
    } else if (result.empty()) {
        m_output << colors::paint(colors::Style::SUCCESS,
                                  "Command completed successfully.")
                 << std::endl;
    } else {
        m_output << colors::paint(colors::Style::INFO, result) << std::endl;
    }
}

void TUI::display_banner()
{
    const std::string title = "FILE SYSTEM MANAGER";
    const size_t padding = (BANNER_WIDTH - title.size()) / 2;

    m_output << "\n" << std::string(BANNER_WIDTH, '=') << "\n";
    m_output << colors::paint(colors::Style::HEADING,
                              std::string(padding, ' ') + title)
             << "\n";
    m_output << std::string(BANNER_WIDTH, '=') << "\n";
    m_output << "\nType 'help' for available commands\n" << std::endl;
}

void TUI::display_help()
{
    const std::string title = "Available commands:";
    m_output << "\n" << colors::paint(colors::Style::HEADING, title) << "\n";
    m_output << colors::paint(colors::Style::RULE,
                              std::string(title.size(), '='))
             << "\n";

    size_t max_cmd_length = 0;
    for (const auto &[command, _] : command_descriptions()) {
        max_cmd_length = std::max(max_cmd_length, command_name(command).size());
    }

    for (const auto &[command, description] : command_descriptions()) {
        // Pad before painting so escape codes do not skew the column
        std::string name = command_name(command);
        name.resize(max_cmd_length + 4, ' ');
        m_output << colors::paint(colors::Style::COMMAND, name) << description
                 << "\n";
    }
    m_output << std::endl;
}

} // namespace cli
} // namespace filewarden
