#ifndef FILEWARDEN_CLI_SHELL_HPP
#define FILEWARDEN_CLI_SHELL_HPP

#include "cli/command.hpp"
#include "cli/interface.hpp"
#include "cli/result_formatter.hpp"
#include "common/filesystem_manager.hpp"
#include "common/logging.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace filewarden {
namespace cli {

/**
 * Settings for the interactive shell
 */
struct ShellConfig {
    bool show_banner = true; // Print the banner when run() starts
    std::string prompt = "\n> ";
};

/**
 * @class Shell
 * @brief Interactive prompt loop driving the FileSystemManager
 *
 * Reads a command token, asks for the command's parameters one prompt at a
 * time, calls one FileSystemManager operation and displays its outcome.
 * Errors are shown and the loop carries on; only `exit`, end of input or an
 * interrupt end it.
 */
class Shell {
  public:
    /**
     * @brief Constructor
     * @param config Shell settings
     * @param logger_name Name for this shell's logger
     */
    explicit Shell(const ShellConfig &config = ShellConfig(),
                   const std::string &logger_name = "Shell");

    /**
     * @brief Sets a custom TUI for testing
     * @param tui Unique pointer to a TUI implementation
     */
    void set_tui(std::unique_ptr<ITUI> tui);

    /**
     * @brief Check if the user has requested exit
     */
    bool is_exit_requested() const;

    /**
     * @brief The manager the shell drives, with its accumulated statistics
     */
    const common::FileSystemManager &manager() const;

    /**
     * @brief Run the prompt loop until exit, end of input or interrupt
     */
    void run();

    /**
     * @brief Handle one line typed at the command prompt
     * @param line The raw input line
     * @return true to keep reading commands, false to stop
     */
    bool process_line(const std::string &line);

  private:
    /**
     * @brief Gather parameters for `command` and execute it
     * @return true to continue, false when input ran out or exit was chosen
     */
    bool process_command(Command command);

    bool handle_list();
    bool handle_transfer(Command command);
    bool handle_delete();
    bool handle_rename();
    bool handle_mkdir();
    bool handle_rmdir();
    bool handle_ext();
    bool handle_bulk_ext();
    bool handle_create();
    bool handle_size();
    bool handle_clean();

    /**
     * @brief End the session if Ctrl+C was pressed
     * @return true when an interrupt is pending
     */
    bool stop_if_interrupted();

    /**
     * @brief Prompt for a value, trimmed
     * @return std::nullopt when input is exhausted or an interrupt is pending
     */
    std::optional<std::string> ask(const std::string &prompt);

    /**
     * @brief Prompt for a y/n answer
     * @return std::nullopt when input is exhausted
     */
    std::optional<bool> ask_yes_no(const std::string &prompt);

    /**
     * @brief Show `status` as a success message or an error line
     */
    void report(const common::OperationStatus &status,
                const std::string &success_message);

    void display_lines(bool success, const std::vector<std::string> &lines);

    ShellConfig m_config;
    std::unique_ptr<ITUI> m_tui;
    common::FileSystemManager m_manager;
    ResultFormatter m_formatter;
    common::Logger m_logger;
    bool m_exit_requested{false};
};

} // namespace cli
} // namespace filewarden

#endif // FILEWARDEN_CLI_SHELL_HPP
