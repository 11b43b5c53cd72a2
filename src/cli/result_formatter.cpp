#include "cli/result_formatter.hpp"

#include <iomanip>
#include <sstream>

namespace filewarden {
namespace cli {

namespace {
std::string group_integer_digits(const std::string &digits)
{
    std::string grouped;
    const size_t length = digits.size();
    for (size_t i = 0; i < length; ++i) {
        if (i > 0 && (length - i) % 3 == 0) {
            grouped.push_back(',');
        }
        grouped.push_back(digits[i]);
    }
    return grouped;
}
} // namespace

ResultFormatter::ResultFormatter()
    : m_logger(common::get_logger("ResultFormatter"))
{
    m_logger->debug("ResultFormatter initialized");
}

std::vector<std::string>
ResultFormatter::format_listing(const std::vector<common::FileInfo> &entries)
{
    std::vector<std::string> result;

    if (entries.empty()) {
        m_logger->debug("Directory is empty");
        result.push_back("(Empty directory)");
        return result;
    }

    for (const auto &entry : entries) {
        std::ostringstream line;
        line << (entry.is_directory ? "DIR" : "FILE") << " - " << entry.path
             << " (" << entry.size << " bytes)";
        result.push_back(line.str());
    }

    m_logger->debug("Directory listing formatted into {} rows", result.size());
    return result;
}

std::vector<std::string>
ResultFormatter::format_size_report(const std::string &path,
                                    uintmax_t size_bytes)
{
    constexpr double KB = 1024.0;
    const double size_kb = static_cast<double>(size_bytes) / KB;
    const double size_mb = size_kb / KB;
    const double size_gb = size_mb / KB;

    return {"Size of " + path + ":",
            "Bytes: " + format_grouped(size_bytes),
            "KB: " + format_grouped(size_kb, 2),
            "MB: " + format_grouped(size_mb, 2),
            "GB: " + format_grouped(size_gb, 4)};
}

std::vector<std::string>
ResultFormatter::format_bulk_report(const common::OperationStats &stats)
{
    return {"Operation completed:",
            "Files processed: " + std::to_string(stats.files_processed),
            "Successful changes: " +
                std::to_string(stats.successful_operations),
            "Failed changes: " + std::to_string(stats.failed_operations)};
}

std::vector<std::string>
ResultFormatter::format_clean_report(const common::OperationStats &stats)
{
    std::vector<std::string> result{"Directory cleaned successfully."};

    if (stats.failed_operations > 0) {
        m_logger->warn("Clean left {} entries behind",
                       stats.failed_operations);
        result.push_back("Removed " +
                         std::to_string(stats.successful_operations) +
                         " entries, " +
                         std::to_string(stats.failed_operations) +
                         " could not be removed");
    }

    return result;
}

std::string ResultFormatter::format_error(const common::OperationStatus &status)
{
    if (status.message.empty()) {
        return "Error: " + common::file_operation_result_to_string(status.result);
    }
    return "Error: " + status.message;
}

std::string ResultFormatter::format_grouped(double value, int precision)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(precision) << value;
    const std::string text = stream.str();

    const size_t dot = text.find('.');
    const std::string integer_part = text.substr(0, dot);
    const std::string fraction_part =
        dot == std::string::npos ? std::string() : text.substr(dot);

    return group_integer_digits(integer_part) + fraction_part;
}

std::string ResultFormatter::format_grouped(uintmax_t value)
{
    return group_integer_digits(std::to_string(value));
}

} // namespace cli
} // namespace filewarden
