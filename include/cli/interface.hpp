#ifndef FILEWARDEN_CLI_INTERFACE_HPP
#define FILEWARDEN_CLI_INTERFACE_HPP

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace filewarden {
namespace cli {

/**
 * @class ITUI
 * @brief Interface for Terminal User Interface operations
 *
 * Abstract base class that defines the interface for user interaction
 * via terminal. This allows for easier testing through mock implementations.
 */
class ITUI {
  public:
    /**
     * @brief Virtual destructor for proper cleanup in derived classes
     */
    virtual ~ITUI() = default;

    /**
     * @brief Show a prompt and read one line of input
     * @param prompt Text shown before the cursor
     * @return The line without its newline, or std::nullopt when input is
     * exhausted or interrupted
     */
    virtual std::optional<std::string> read_line(const std::string &prompt) = 0;

    /**
     * @brief Display result of command execution
     * @param success Whether command was successful
     * @param result Result message or data
     */
    virtual void display_result(bool success, const std::string &result) = 0;

    /**
     * @brief Display the startup banner
     */
    virtual void display_banner() = 0;

    /**
     * @brief Display help information about available commands
     */
    virtual void display_help() = 0;
};

/**
 * @class TUI
 * @brief Terminal User Interface reading from and writing to streams
 *
 * Defaults to std::cin / std::cout.
 */
class TUI : public ITUI {
  public:
    TUI();

    TUI(std::istream &input, std::ostream &output);

    std::optional<std::string> read_line(const std::string &prompt) override;

    /**
     * @brief Display result of command execution
     *
     * Successful results are shown in the info color, failures in the error
     * color; text that already carries color codes is printed as is.
     */
    void display_result(bool success, const std::string &result) override;

    void display_banner() override;

    /**
     * @brief Display help information about available commands
     */
    void display_help() override;

  private:
    std::istream &m_input;
    std::ostream &m_output;
};

} // namespace cli
} // namespace filewarden

#endif // FILEWARDEN_CLI_INTERFACE_HPP
