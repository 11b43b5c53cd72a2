#ifndef FILEWARDEN_COMMON_FILESYSTEM_MANAGER_HPP
#define FILEWARDEN_COMMON_FILESYSTEM_MANAGER_HPP

#include "common/file_operations.hpp"
#include "common/logging.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace filewarden {
namespace common {

/**
 * Counters accumulated by a FileSystemManager
 */
struct OperationStats {
    uint64_t files_processed = 0;
    uint64_t directories_processed = 0;
    uint64_t successful_operations = 0;
    uint64_t failed_operations = 0;

    void reset()
    {
        *this = OperationStats{};
    }
};

/**
 * @class FileSystemManager
 * @brief Filesystem maintenance operations with validation and accounting
 *
 * Every operation normalizes its input paths, reports failures through an
 * OperationStatus instead of throwing, and updates the manager's statistics.
 * Statistics accumulate across calls until reset_stats(); the bulk
 * operations (bulk_change_extensions, clean_directory) reset them first.
 *
 * Not thread-safe: one manager is meant to be driven by one thread.
 */
class FileSystemManager {
  public:
    /**
     * @brief Constructor
     * @param logger_name Name for the logger instance
     */
    explicit FileSystemManager(
        const std::string &logger_name = "FileSystemManager");

    /**
     * @brief Resolve a path to absolute, canonical form
     * @param path Path as typed by the user; empty means "."
     * @param should_exist Fail with PATH_NOT_FOUND if nothing exists there
     * @return Pair of (resolved path, status)
     */
    std::pair<std::filesystem::path, OperationStatus>
    validate_path(const std::string &path, bool should_exist = true) const;

    /**
     * @brief List a directory
     *
     * With `recursive`, the contents of each subdirectory are emitted before
     * the subdirectory's own entry. Entries whose metadata cannot be read are
     * skipped and counted as failures.
     *
     * @param directory Directory to list
     * @param recursive Descend into subdirectories
     * @return Pair of (entries, status)
     */
    std::pair<std::vector<FileInfo>, OperationStatus>
    list_directory(const std::string &directory, bool recursive = false);

    /**
     * @brief Copy a file, preserving permissions and modification time
     * @param source File to copy
     * @param destination Target file path or directory
     * @param overwrite Replace an existing destination file
     */
    OperationStatus copy_file(const std::string &source,
                              const std::string &destination,
                              bool overwrite = false);

    /**
     * @brief Move a file
     * @param source File to move
     * @param destination Target file path or directory
     * @param overwrite Remove an existing destination file first
     */
    OperationStatus move_file(const std::string &source,
                              const std::string &destination,
                              bool overwrite = false);

    OperationStatus delete_file(const std::string &file_path);

    /**
     * @brief Create a directory
     * @param dir_path Directory to create
     * @param parents Create missing parent directories
     * @param exist_ok Treat an existing directory as success
     */
    OperationStatus create_directory(const std::string &dir_path,
                                     bool parents = true,
                                     bool exist_ok = true);

    /**
     * @brief Delete a directory
     *
     * Without `recursive` only an empty directory can be removed; anything
     * else fails with NOT_EMPTY_DIRECTORY and leaves the directory intact.
     */
    OperationStatus delete_directory(const std::string &dir_path,
                                     bool recursive = false);

    /**
     * @brief Rename an entry inside its own directory
     *
     * Refuses to replace an existing entry.
     *
     * @param source Entry to rename
     * @param new_name Plain file name, without directory components
     */
    OperationStatus rename_file(const std::string &source,
                                const std::string &new_name);

    /**
     * @brief Replace a file's extension
     * @param file_path File to rename
     * @param new_extension Extension with or without the leading dot
     */
    OperationStatus change_extension(const std::string &file_path,
                                     const std::string &new_extension);

    /**
     * @brief Change the extension of every matching file in a directory
     *
     * Resets the statistics first. Files whose renamed target already exists
     * are skipped and counted as failures.
     *
     * @param directory Directory to process
     * @param current_extensions Extensions to match, case-insensitively
     * @param new_extension Extension to give the matched files
     * @param recursive Process subdirectories too
     * @return Pair of (statistics of this run, status)
     */
    std::pair<OperationStats, OperationStatus>
    bulk_change_extensions(const std::string &directory,
                           const std::vector<std::string> &current_extensions,
                           const std::string &new_extension,
                           bool recursive = false);

    /**
     * @brief Create a new file
     *
     * `.json` files get "{}" and `.csv` files stay empty whatever `content`
     * holds. Fails if the file already exists.
     */
    OperationStatus
    create_empty_file(const std::string &file_path,
                      const std::optional<std::string> &content = std::nullopt);

    /**
     * @brief Sum the sizes of the regular files in a directory
     * @param directory Directory to measure
     * @param recursive Include files in subdirectories
     * @return Pair of (size in bytes, status)
     */
    std::pair<uintmax_t, OperationStatus>
    get_directory_size(const std::string &directory, bool recursive = true);

    /**
     * @brief Remove everything inside a directory, keeping the directory
     *
     * Resets the statistics first. A child that cannot be removed is logged
     * and counted; the sweep carries on with the rest.
     */
    OperationStatus clean_directory(const std::string &directory);

    const OperationStats &stats() const
    {
        return m_stats;
    }

    void reset_stats();

  private:
    /**
     * @brief Shared front half of copy and move
     *
     * Validates the source, resolves the destination anchor and final
     * destination path, and applies the overwrite policy check.
     */
    OperationStatus resolve_transfer(const std::string &operation,
                                     const std::string &source,
                                     const std::string &destination,
                                     bool overwrite,
                                     std::filesystem::path &source_path,
                                     std::filesystem::path &final_destination);

    /**
     * @brief Validate that `directory` exists and is a directory
     */
    std::pair<std::filesystem::path, OperationStatus>
    require_directory(const std::string &operation,
                      const std::string &directory) const;

    /**
     * @brief Count and log a failed operation, passing the status through
     */
    OperationStatus fail(OperationStatus status);

    OperationStats m_stats;
    Logger m_logger;
};

} // namespace common
} // namespace filewarden

#endif // FILEWARDEN_COMMON_FILESYSTEM_MANAGER_HPP
