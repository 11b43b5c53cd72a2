#include "cli/shell.hpp"
#include "cli/interrupt.hpp"
#include "common/file_operations.hpp"

#include <stdexcept>

namespace filewarden {
namespace cli {

using namespace common;

Shell::Shell(const ShellConfig &config, const std::string &logger_name)
    : m_config(config), m_tui(std::make_unique<TUI>()), m_manager(),
      m_formatter(), m_logger(get_logger(logger_name)), m_exit_requested(false)
{
    m_logger->debug("shell initialized");
}

void Shell::set_tui(std::unique_ptr<ITUI> tui)
{
    m_tui = std::move(tui);
}

bool Shell::is_exit_requested() const
{
    return m_exit_requested;
}

const FileSystemManager &Shell::manager() const
{
    return m_manager;
}

void Shell::run()
{
    m_logger->info("filewarden shell starting");

    if (!m_tui) {
        m_logger->error("TUI not initialized, cannot run shell");
        m_exit_requested = true;
        return;
    }

    if (m_config.show_banner) {
        m_tui->display_banner();
    }

    while (!m_exit_requested && !stop_if_interrupted()) {
        auto line = ask(m_config.prompt);
        if (!line) {
            break;
        }

        try {
            if (!process_line(*line)) {
                break;
            }
        } catch (const std::exception &e) {
            m_logger->error("exception during command processing: {}",
                            e.what());
            m_tui->display_result(false, std::string("Error: ") + e.what());
        }
    }

    m_logger->info("filewarden shell exiting");
}

bool Shell::process_line(const std::string &line)
{
    const std::string token = trim(line);
    if (token.empty()) {
        return true;
    }

    auto command = parse_command(token);
    if (!command) {
        m_logger->debug("unknown command '{}'", token);
        m_tui->display_result(
            false,
            "Invalid command. Type 'help' for available commands.");
        return true;
    }

    m_logger->debug("processing command '{}'", command_name(*command));
    return process_command(*command);
}

bool Shell::process_command(Command command)
{
    switch (command) {
    case Command::LIST:
        return handle_list();
    case Command::COPY:
    case Command::MOVE:
        return handle_transfer(command);
    case Command::DELETE:
        return handle_delete();
    case Command::RENAME:
        return handle_rename();
    case Command::MKDIR:
        return handle_mkdir();
    case Command::RMDIR:
        return handle_rmdir();
    case Command::EXT:
        return handle_ext();
    case Command::BULK_EXT:
        return handle_bulk_ext();
    case Command::CREATE:
        return handle_create();
    case Command::SIZE:
        return handle_size();
    case Command::CLEAN:
        return handle_clean();
    case Command::HELP:
        m_tui->display_help();
        return true;
    case Command::EXIT:
        m_logger->info("exit command received");
        m_tui->display_result(true, "Goodbye!");
        m_exit_requested = true;
        return false;
    }

    throw std::logic_error("unhandled command " + command_name(command));
}

bool Shell::stop_if_interrupted()
{
    if (!interrupt::requested()) {
        return false;
    }
    if (!m_exit_requested) {
        m_logger->info("interrupted by user");
        m_tui->display_result(false, "Operation cancelled by user.");
        m_exit_requested = true;
    }
    return true;
}

std::optional<std::string> Shell::ask(const std::string &prompt)
{
    // Ctrl+C during an operation is honoured before the next read
    if (stop_if_interrupted()) {
        return std::nullopt;
    }

    auto answer = m_tui->read_line(prompt);
    if (!answer) {
        if (!stop_if_interrupted()) {
            m_logger->info("end of input");
            m_exit_requested = true;
        }
        return std::nullopt;
    }
    return trim(*answer);
}

std::optional<bool> Shell::ask_yes_no(const std::string &prompt)
{
    auto answer = ask(prompt);
    if (!answer) {
        return std::nullopt;
    }
    return is_affirmative(*answer);
}

void Shell::report(const OperationStatus &status,
                   const std::string &success_message)
{
    if (status.ok()) {
        m_tui->display_result(true, success_message);
    } else {
        m_tui->display_result(false, m_formatter.format_error(status));
    }
}

void Shell::display_lines(bool success, const std::vector<std::string> &lines)
{
    for (const auto &line : lines) {
        m_tui->display_result(success, line);
    }
}

bool Shell::handle_list()
{
    auto path = ask("Directory path (leave blank for current): ");
    if (!path) {
        return false;
    }
    auto recursive = ask_yes_no("Recursive? (y/n): ");
    if (!recursive) {
        return false;
    }

    auto [entries, status] =
        m_manager.list_directory(path->empty() ? "." : *path, *recursive);
    if (!status.ok()) {
        m_tui->display_result(false, m_formatter.format_error(status));
        return true;
    }

    display_lines(true, m_formatter.format_listing(entries));
    return true;
}

bool Shell::handle_transfer(Command command)
{
    auto source = ask("Source file: ");
    if (!source) {
        return false;
    }
    auto destination = ask("Destination: ");
    if (!destination) {
        return false;
    }
    auto overwrite = ask_yes_no("Overwrite if exists? (y/n): ");
    if (!overwrite) {
        return false;
    }

    if (command == Command::MOVE) {
        report(m_manager.move_file(*source, *destination, *overwrite),
               "File moved successfully.");
    } else {
        report(m_manager.copy_file(*source, *destination, *overwrite),
               "File copied successfully.");
    }
    return true;
}

bool Shell::handle_delete()
{
    auto path = ask("File to delete: ");
    if (!path) {
        return false;
    }
    auto confirm =
        ask_yes_no("Are you sure you want to delete " + *path + "? (y/n): ");
    if (!confirm) {
        return false;
    }

    if (!*confirm) {
        m_tui->display_result(true, "Operation cancelled.");
        return true;
    }

    report(m_manager.delete_file(*path), "File deleted successfully.");
    return true;
}

bool Shell::handle_rename()
{
    auto source = ask("File to rename: ");
    if (!source) {
        return false;
    }
    auto new_name = ask("New name: ");
    if (!new_name) {
        return false;
    }

    report(m_manager.rename_file(*source, *new_name),
           "File renamed successfully.");
    return true;
}

bool Shell::handle_mkdir()
{
    auto path = ask("Directory path: ");
    if (!path) {
        return false;
    }
    auto parents = ask_yes_no("Create parent directories if needed? (y/n): ");
    if (!parents) {
        return false;
    }

    report(m_manager.create_directory(*path, *parents, true),
           "Directory created successfully.");
    return true;
}

bool Shell::handle_rmdir()
{
    auto path = ask("Directory to delete: ");
    if (!path) {
        return false;
    }
    auto recursive = ask_yes_no("Delete contents recursively? (y/n): ");
    if (!recursive) {
        return false;
    }
    auto confirm =
        ask_yes_no("Are you sure you want to delete " + *path + "? (y/n): ");
    if (!confirm) {
        return false;
    }

    if (!*confirm) {
        m_tui->display_result(true, "Operation cancelled.");
        return true;
    }

    report(m_manager.delete_directory(*path, *recursive),
           "Directory deleted successfully.");
    return true;
}

bool Shell::handle_ext()
{
    auto path = ask("File path: ");
    if (!path) {
        return false;
    }
    auto extension = ask("New extension (with dot, e.g. '.txt'): ");
    if (!extension) {
        return false;
    }

    report(m_manager.change_extension(*path, *extension),
           "Extension changed successfully.");
    return true;
}

bool Shell::handle_bulk_ext()
{
    auto directory = ask("Directory path: ");
    if (!directory) {
        return false;
    }
    auto extensions =
        ask("Current extensions (comma separated, e.g. '.txt,.doc'): ");
    if (!extensions) {
        return false;
    }
    auto new_extension = ask("New extension (with dot, e.g. '.md'): ");
    if (!new_extension) {
        return false;
    }
    auto recursive = ask_yes_no("Process subdirectories? (y/n): ");
    if (!recursive) {
        return false;
    }

    auto [stats, status] =
        m_manager.bulk_change_extensions(*directory,
                                         split_list(*extensions),
                                         *new_extension,
                                         *recursive);
    if (!status.ok()) {
        m_tui->display_result(false, m_formatter.format_error(status));
        return true;
    }

    display_lines(true, m_formatter.format_bulk_report(stats));
    return true;
}

bool Shell::handle_create()
{
    auto path = ask("File path: ");
    if (!path) {
        return false;
    }
    auto content = ask("Optional content (leave blank for empty file): ");
    if (!content) {
        return false;
    }

    std::optional<std::string> file_content;
    if (!content->empty()) {
        file_content = *content;
    }

    report(m_manager.create_empty_file(*path, file_content),
           "File created successfully.");
    return true;
}

bool Shell::handle_size()
{
    auto path = ask("Directory path: ");
    if (!path) {
        return false;
    }
    auto recursive = ask_yes_no("Include subdirectories? (y/n): ");
    if (!recursive) {
        return false;
    }

    auto [size_bytes, status] = m_manager.get_directory_size(*path, *recursive);
    if (!status.ok()) {
        m_tui->display_result(false, m_formatter.format_error(status));
        return true;
    }

    display_lines(true, m_formatter.format_size_report(*path, size_bytes));
    return true;
}

bool Shell::handle_clean()
{
    auto path = ask("Directory to clean: ");
    if (!path) {
        return false;
    }
    auto confirm = ask_yes_no("Are you sure you want to delete ALL contents of " +
                              *path + "? (y/n): ");
    if (!confirm) {
        return false;
    }

    if (!*confirm) {
        m_tui->display_result(true, "Operation cancelled.");
        return true;
    }

    const OperationStatus status = m_manager.clean_directory(*path);
    if (!status.ok()) {
        m_tui->display_result(false, m_formatter.format_error(status));
        return true;
    }

    display_lines(true, m_formatter.format_clean_report(m_manager.stats()));
    return true;
}

} // namespace cli
} // namespace filewarden
