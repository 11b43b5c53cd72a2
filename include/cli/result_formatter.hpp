#ifndef FILEWARDEN_CLI_RESULT_FORMATTER_HPP
#define FILEWARDEN_CLI_RESULT_FORMATTER_HPP

#include "common/file_operations.hpp"
#include "common/filesystem_manager.hpp"
#include "common/logging.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace filewarden {
namespace cli {

/**
 * @class ResultFormatter
 * @brief Turns operation results into lines for the TUI
 */
class ResultFormatter {
  public:
    /**
     * @brief Constructor
     */
    ResultFormatter();

    /**
     * @brief Format a directory listing, one line per entry
     * @param entries Entries as returned by FileSystemManager::list_directory
     * @return "DIR - <path> (<size> bytes)" / "FILE - ..." lines
     */
    std::vector<std::string>
    format_listing(const std::vector<common::FileInfo> &entries);

    /**
     * @brief Format a directory size in bytes, KB, MB and GB
     * @param path Directory as the user typed it
     * @param size_bytes Total size
     */
    std::vector<std::string> format_size_report(const std::string &path,
                                                uintmax_t size_bytes);

    /**
     * @brief Format the statistics of a bulk extension change
     */
    std::vector<std::string>
    format_bulk_report(const common::OperationStats &stats);

    /**
     * @brief Format the outcome of a directory clean
     */
    std::vector<std::string>
    format_clean_report(const common::OperationStats &stats);

    /**
     * @brief Format a failed operation as a single line
     */
    std::string format_error(const common::OperationStatus &status);

    /**
     * @brief Format a number with ',' thousands separators
     * @param value Number to format
     * @param precision Digits after the decimal point
     */
    static std::string format_grouped(double value, int precision);

    static std::string format_grouped(uintmax_t value);

  private:
    common::Logger m_logger;
};

} // namespace cli
} // namespace filewarden

#endif // FILEWARDEN_CLI_RESULT_FORMATTER_HPP
