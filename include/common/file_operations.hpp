#ifndef FILEWARDEN_COMMON_FILE_OPERATIONS_HPP
#define FILEWARDEN_COMMON_FILE_OPERATIONS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace filewarden {
namespace common {

/**
 * Result of file operations
 */
enum class FileOperationResult {
    SUCCESS = 0,
    PATH_NOT_FOUND,
    PERMISSION_DENIED,
    NOT_EMPTY_DIRECTORY,
    UNSUPPORTED_OPERATION,
    FILE_SYSTEM_ERROR
};

/**
 * Convert FileOperationResult to string representation
 *
 * @param result FileOperationResult to convert
 * @return String representation of the result
 */
std::string file_operation_result_to_string(FileOperationResult result);

/**
 * Convert system_error to FileOperationResult
 *
 * @param ec System error code
 * @return Equivalent FileOperationResult
 */
FileOperationResult
system_error_to_file_operation_result(const std::error_code &ec);

/**
 * Outcome of a single operation, with enough context to report it
 *
 * On failure `result` names the error kind, `operation` the operation that
 * failed, `path` and `target` the paths involved, and `error_code` the host
 * errno value (0 when the failure did not come from the OS).
 */
struct OperationStatus {
    FileOperationResult result = FileOperationResult::SUCCESS;
    std::string message;
    std::string operation;
    std::string path;
    std::string target;
    int error_code = 0;

    bool ok() const
    {
        return result == FileOperationResult::SUCCESS;
    }

    /**
     * One-line rendering: "<kind>: <message>"
     */
    std::string to_string() const;

    static OperationStatus success(const std::string &operation,
                                   const std::string &path,
                                   const std::string &target = "");

    static OperationStatus failure(FileOperationResult result,
                                   const std::string &operation,
                                   const std::string &path,
                                   const std::string &message,
                                   const std::string &target = "");

    /**
     * Build a failure from an OS error; the kind is derived from `ec` and
     * the OS description is appended to `message`.
     */
    static OperationStatus from_error_code(const std::error_code &ec,
                                           const std::string &operation,
                                           const std::string &path,
                                           const std::string &message,
                                           const std::string &target = "");
};

/**
 * Point-in-time snapshot of a filesystem entry
 *
 * Timestamps are Unix seconds. created_time is st_ctime, which on POSIX
 * hosts is the inode change time.
 */
struct FileInfo {
    std::string path;
    std::string name;
    uintmax_t size = 0;
    int64_t created_time = 0;
    int64_t modified_time = 0;
    int64_t accessed_time = 0;
    bool is_directory = false;
    bool is_file = false;
};

/**
 * Get file information (size, timestamps, type)
 *
 * Follows symbolic links, like stat(2).
 *
 * @param filepath Path to the file
 * @return Pair of (FileInfo, FileOperationResult)
 */
std::pair<FileInfo, FileOperationResult>
get_file_info(const std::filesystem::path &filepath);

/**
 * Write data to a file (creates the file if it doesn't exist, otherwise
 * overwrites)
 *
 * @param filepath Path to the file to write
 * @param data Data to write to the file
 * @return FileOperationResult indicating success or failure
 */
FileOperationResult write_file(const std::filesystem::path &filepath,
                               const std::string &data);

/**
 * Check if a path names anything, including a dangling symbolic link
 *
 * @param filepath Path to check
 * @return True if an entry exists, false otherwise
 */
bool file_exists(const std::filesystem::path &filepath);

/**
 * Prefix an extension with '.' unless it already starts with one
 */
std::string normalize_extension(const std::string &extension);

/**
 * Strip leading and trailing whitespace
 */
std::string trim(const std::string &text);

/**
 * ASCII lower-casing, used for case-insensitive extension matching
 */
std::string to_lower(std::string text);

/**
 * Check whether the path's extension is one of `extensions`
 *
 * @param filepath Path to check
 * @param extensions Normalized, lower-cased extensions (".txt")
 * @return True on a case-insensitive match
 */
bool extension_matches(const std::filesystem::path &filepath,
                       const std::vector<std::string> &extensions);

} // namespace common
} // namespace filewarden

#endif // FILEWARDEN_COMMON_FILE_OPERATIONS_HPP
