#include "common/filesystem_manager.hpp"

#include <algorithm>
#include <optional>

namespace fs = std::filesystem;

namespace filewarden {
namespace common {

namespace {

// Pending directory in the depth-first listing; its own entry is emitted
// once all of its children have been.
struct ListingFrame {
    std::vector<fs::path> children;
    size_t next = 0;
    std::optional<FileInfo> own_entry;
};

std::vector<fs::path> sorted_children(const fs::path &directory,
                                      std::error_code &ec)
{
    std::vector<fs::path> children;
    fs::directory_iterator it(directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        return {};
    }
    std::sort(children.begin(), children.end());
    return children;
}

bool is_real_directory(const fs::path &path)
{
    std::error_code ec;
    return fs::is_directory(fs::symlink_status(path, ec));
}

bool is_filesystem_root(const fs::path &path)
{
    return path == path.root_path();
}

} // namespace

FileSystemManager::FileSystemManager(const std::string &logger_name)
    : m_stats(), m_logger(get_logger(logger_name))
{
    m_logger->debug("FileSystemManager initialized");
}

void FileSystemManager::reset_stats()
{
    m_stats.reset();
}

OperationStatus FileSystemManager::fail(OperationStatus status)
{
    m_stats.failed_operations++;
    m_logger->error("{}", status.message);
    return status;
}

std::pair<fs::path, OperationStatus>
FileSystemManager::validate_path(const std::string &path,
                                 bool should_exist) const
{
    std::error_code ec;
    const fs::path input = path.empty() ? fs::path(".") : fs::path(path);

    fs::path absolute = fs::absolute(input, ec);
    if (ec) {
        return {input,
                OperationStatus::from_error_code(
                    ec,
                    "validate",
                    path,
                    "Could not resolve path '" + path + "'")};
    }

    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        m_logger->debug("falling back to lexical normalization for '{}': {}",
                        absolute.string(),
                        ec.message());
        resolved = absolute.lexically_normal();
    }

    // "dir/" and "dir" name the same entry
    if (!resolved.has_filename() && resolved.has_relative_path()) {
        resolved = resolved.parent_path();
    }

    if (should_exist && !file_exists(resolved)) {
        return {resolved,
                OperationStatus::failure(FileOperationResult::PATH_NOT_FOUND,
                                         "validate",
                                         resolved.string(),
                                         "Path '" + resolved.string() +
                                             "' does not exist")};
    }

    return {resolved, OperationStatus::success("validate", resolved.string())};
}

std::pair<fs::path, OperationStatus>
FileSystemManager::require_directory(const std::string &operation,
                                     const std::string &directory) const
{
    auto [dir, status] = validate_path(directory, true);
    if (!status.ok()) {
        status.operation = operation;
        return {dir, status};
    }

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return {dir,
                OperationStatus::failure(FileOperationResult::FILE_SYSTEM_ERROR,
                                         operation,
                                         dir.string(),
                                         "Path " + dir.string() +
                                             " is not a directory")};
    }

    return {dir, status};
}

std::pair<std::vector<FileInfo>, OperationStatus>
FileSystemManager::list_directory(const std::string &directory, bool recursive)
{
    std::vector<FileInfo> results;

    auto [root, status] = require_directory("list", directory);
    if (!status.ok()) {
        return {results, fail(status)};
    }

    std::error_code ec;
    std::vector<ListingFrame> stack;
    stack.push_back(ListingFrame{sorted_children(root, ec), 0, std::nullopt});
    if (ec) {
        return {results,
                fail(OperationStatus::from_error_code(
                    ec,
                    "list",
                    root.string(),
                    "Could not list directory " + root.string()))};
    }

    while (!stack.empty()) {
        ListingFrame &frame = stack.back();

        if (frame.next == frame.children.size()) {
            std::optional<FileInfo> own_entry = std::move(frame.own_entry);
            stack.pop_back();

            m_stats.directories_processed++;
            m_stats.successful_operations++;
            if (own_entry) {
                results.push_back(std::move(*own_entry));
                m_stats.files_processed++;
            }
            continue;
        }

        const fs::path child = frame.children[frame.next++];
        auto [info, result] = get_file_info(child);
        if (result != FileOperationResult::SUCCESS) {
            m_logger->warn("Could not process {}: {}",
                           child.string(),
                           file_operation_result_to_string(result));
            m_stats.failed_operations++;
            continue;
        }

        if (recursive && info.is_directory && is_real_directory(child)) {
            std::vector<fs::path> grandchildren = sorted_children(child, ec);
            if (ec) {
                m_logger->warn("Could not process {}: {}",
                               child.string(),
                               ec.message());
                m_stats.failed_operations++;
                ec.clear();
                continue;
            }
            // `frame` is not used past this point; push_back may reallocate
            stack.push_back(
                ListingFrame{std::move(grandchildren), 0, std::move(info)});
            continue;
        }

        results.push_back(std::move(info));
        m_stats.files_processed++;
    }

    m_logger->info("Listed {} entries in {}", results.size(), root.string());
    return {results, status};
}

OperationStatus
FileSystemManager::resolve_transfer(const std::string &operation,
                                    const std::string &source,
                                    const std::string &destination,
                                    bool overwrite,
                                    fs::path &source_path,
                                    fs::path &final_destination)
{
    auto [src, status] = validate_path(source, true);
    if (!status.ok()) {
        status.operation = operation;
        return status;
    }
    source_path = src;

    std::error_code ec;
    if (fs::is_directory(src, ec)) {
        return OperationStatus::failure(
            FileOperationResult::UNSUPPORTED_OPERATION,
            operation,
            src.string(),
            "Cannot " + operation + " " + src.string() +
                ": directories are not supported",
            destination);
    }

    // An existing file as destination anchors on its parent directory
    const fs::path requested = destination.empty() ? fs::path(".")
                                                   : fs::path(destination);
    const std::string anchor_input = fs::is_regular_file(requested, ec)
                                         ? requested.parent_path().string()
                                         : requested.string();

    auto [anchor, anchor_status] = validate_path(anchor_input, false);
    if (!anchor_status.ok()) {
        anchor_status.operation = operation;
        anchor_status.target = anchor_status.path;
        anchor_status.path = src.string();
        return anchor_status;
    }

    final_destination = anchor;
    if (fs::is_directory(anchor, ec)) {
        final_destination = anchor / src.filename();
    }

    if (file_exists(final_destination)) {
        if (fs::equivalent(src, final_destination, ec)) {
            return OperationStatus::failure(
                FileOperationResult::FILE_SYSTEM_ERROR,
                operation,
                src.string(),
                "Source and destination are the same file: " + src.string(),
                final_destination.string());
        }
        if (!overwrite) {
            return OperationStatus::failure(
                FileOperationResult::FILE_SYSTEM_ERROR,
                operation,
                src.string(),
                "Destination file " + final_destination.string() +
                    " already exists",
                final_destination.string());
        }
        if (is_real_directory(final_destination)) {
            return OperationStatus::failure(
                FileOperationResult::FILE_SYSTEM_ERROR,
                operation,
                src.string(),
                "Destination " + final_destination.string() +
                    " is a directory",
                final_destination.string());
        }
    }

    return OperationStatus::success(operation,
                                    src.string(),
                                    final_destination.string());
}

OperationStatus FileSystemManager::copy_file(const std::string &source,
                                             const std::string &destination,
                                             bool overwrite)
{
    fs::path src;
    fs::path dst;
    OperationStatus status =
        resolve_transfer("copy", source, destination, overwrite, src, dst);
    if (!status.ok()) {
        return fail(status);
    }

    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return fail(OperationStatus::from_error_code(
            ec,
            "copy",
            src.string(),
            "Could not copy " + src.string() + " to " + dst.string(),
            dst.string()));
    }

    // Permissions travel with copy_file; the modification time does not
    const auto modified = fs::last_write_time(src, ec);
    if (!ec) {
        fs::last_write_time(dst, modified, ec);
    }
    if (ec) {
        m_logger->warn("Could not preserve timestamps on {}: {}",
                       dst.string(),
                       ec.message());
    }

    m_stats.files_processed++;
    m_stats.successful_operations++;
    m_logger->info("Copied {} to {}", src.string(), dst.string());
    return status;
}

OperationStatus FileSystemManager::move_file(const std::string &source,
                                             const std::string &destination,
                                             bool overwrite)
{
    fs::path src;
    fs::path dst;
    OperationStatus status =
        resolve_transfer("move", source, destination, overwrite, src, dst);
    if (!status.ok()) {
        return fail(status);
    }

    std::error_code ec;
    if (overwrite && file_exists(dst)) {
        fs::remove(dst, ec);
        if (ec) {
            return fail(OperationStatus::from_error_code(
                ec,
                "move",
                src.string(),
                "Could not replace " + dst.string(),
                dst.string()));
        }
    }

    fs::rename(src, dst, ec);
    if (ec == std::errc::cross_device_link) {
        // Different filesystems: copy, then remove the original. A failure
        // after the copy leaves both files in place.
        ec.clear();
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::last_write_time(dst, fs::last_write_time(src, ec), ec);
            ec.clear();
            fs::remove(src, ec);
        }
    }
    if (ec) {
        return fail(OperationStatus::from_error_code(
            ec,
            "move",
            src.string(),
            "Could not move " + src.string() + " to " + dst.string(),
            dst.string()));
    }

    m_stats.files_processed++;
    m_stats.successful_operations++;
    m_logger->info("Moved {} to {}", src.string(), dst.string());
    return status;
}

OperationStatus FileSystemManager::delete_file(const std::string &file_path)
{
    auto [path, status] = validate_path(file_path, true);
    if (!status.ok()) {
        status.operation = "delete";
        return fail(status);
    }

    if (is_real_directory(path)) {
        return fail(
            OperationStatus::failure(FileOperationResult::FILE_SYSTEM_ERROR,
                                     "delete",
                                     path.string(),
                                     "Path " + path.string() +
                                         " is a directory"));
    }

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return fail(OperationStatus::from_error_code(
            ec,
            "delete",
            path.string(),
            "Could not delete file " + path.string()));
    }

    m_stats.files_processed++;
    m_stats.successful_operations++;
    m_logger->info("Deleted file {}", path.string());
    return OperationStatus::success("delete", path.string());
}

OperationStatus FileSystemManager::create_directory(const std::string &dir_path,
                                                    bool parents,
                                                    bool exist_ok)
{
    auto [dir, status] = validate_path(dir_path, false);
    if (!status.ok()) {
        status.operation = "mkdir";
        return fail(status);
    }

    std::error_code ec;
    if (file_exists(dir)) {
        if (!fs::is_directory(dir, ec)) {
            return fail(OperationStatus::failure(
                FileOperationResult::FILE_SYSTEM_ERROR,
                "mkdir",
                dir.string(),
                "Path " + dir.string() + " exists and is not a directory"));
        }
        if (!exist_ok) {
            return fail(OperationStatus::failure(
                FileOperationResult::FILE_SYSTEM_ERROR,
                "mkdir",
                dir.string(),
                "Directory " + dir.string() + " already exists"));
        }
        m_stats.directories_processed++;
        m_stats.successful_operations++;
        m_logger->info("Directory {} already exists", dir.string());
        return OperationStatus::success("mkdir", dir.string());
    }

    if (parents) {
        fs::create_directories(dir, ec);
    } else if (!fs::is_directory(dir.parent_path(), ec)) {
        return fail(OperationStatus::failure(
            FileOperationResult::PATH_NOT_FOUND,
            "mkdir",
            dir.string(),
            "Parent directory " + dir.parent_path().string() +
                " does not exist"));
    } else {
        fs::create_directory(dir, ec);
    }

    if (ec) {
        return fail(OperationStatus::from_error_code(
            ec,
            "mkdir",
            dir.string(),
            "Could not create directory " + dir.string()));
    }

    m_stats.directories_processed++;
    m_stats.successful_operations++;
    m_logger->info("Created directory {}", dir.string());
    return OperationStatus::success("mkdir", dir.string());
}

OperationStatus FileSystemManager::delete_directory(const std::string &dir_path,
                                                    bool recursive)
{
    auto [dir, status] = require_directory("rmdir", dir_path);
    if (!status.ok()) {
        return fail(status);
    }

    if (is_filesystem_root(dir)) {
        return fail(OperationStatus::failure(
            FileOperationResult::UNSUPPORTED_OPERATION,
            "rmdir",
            dir.string(),
            "Refusing to delete the filesystem root"));
    }

    std::error_code ec;
    if (recursive) {
        fs::remove_all(dir, ec);
    } else {
        fs::remove(dir, ec);
        if (ec == std::errc::directory_not_empty ||
            ec == std::errc::file_exists) {
            return fail(OperationStatus::failure(
                FileOperationResult::NOT_EMPTY_DIRECTORY,
                "rmdir",
                dir.string(),
                "Directory " + dir.string() + " is not empty"));
        }
    }

    if (ec) {
        return fail(OperationStatus::from_error_code(
            ec,
            "rmdir",
            dir.string(),
            "Could not delete directory " + dir.string()));
    }

    m_stats.directories_processed++;
    m_stats.successful_operations++;
    m_logger->info("Deleted directory {}", dir.string());
    return OperationStatus::success("rmdir", dir.string());
}

OperationStatus FileSystemManager::rename_file(const std::string &source,
                                               const std::string &new_name)
{
    auto [src, status] = validate_path(source, true);
    if (!status.ok()) {
        status.operation = "rename";
        return fail(status);
    }

    const fs::path name(new_name);
    if (new_name.empty() || name.filename() != name || new_name == "." ||
        new_name == "..") {
        return fail(
            OperationStatus::failure(FileOperationResult::FILE_SYSTEM_ERROR,
                                     "rename",
                                     src.string(),
                                     "Invalid file name '" + new_name + "'"));
    }

    const fs::path target = src.parent_path() / name;
    if (file_exists(target)) {
        return fail(
            OperationStatus::failure(FileOperationResult::FILE_SYSTEM_ERROR,
                                     "rename",
                                     src.string(),
                                     "Destination file " + target.string() +
                                         " already exists",
                                     target.string()));
    }

    std::error_code ec;
    fs::rename(src, target, ec);
    if (ec) {
        return fail(OperationStatus::from_error_code(
            ec,
            "rename",
            src.string(),
            "Could not rename " + src.string() + " to " + new_name,
            target.string()));
    }

    m_stats.files_processed++;
    m_stats.successful_operations++;
    m_logger->info("Renamed {} to {}", src.string(), target.string());
    return OperationStatus::success("rename", src.string(), target.string());
}

OperationStatus
FileSystemManager::change_extension(const std::string &file_path,
                                    const std::string &new_extension)
{
    auto [path, status] = validate_path(file_path, true);
    if (!status.ok()) {
        status.operation = "ext";
        return fail(status);
    }

    const std::string extension = normalize_extension(new_extension);
    if (extension == "." || extension.find('/') != std::string::npos) {
        return fail(
            OperationStatus::failure(FileOperationResult::FILE_SYSTEM_ERROR,
                                     "ext",
                                     path.string(),
                                     "Invalid extension '" + new_extension +
                                         "'"));
    }

    fs::path target = path;
    target.replace_extension(extension);
    if (file_exists(target)) {
        return fail(
            OperationStatus::failure(FileOperationResult::FILE_SYSTEM_ERROR,
                                     "ext",
                                     path.string(),
                                     "Destination file " + target.string() +
                                         " already exists",
                                     target.string()));
    }

    std::error_code ec;
    fs::rename(path, target, ec);
    if (ec) {
        return fail(OperationStatus::from_error_code(
            ec,
            "ext",
            path.string(),
            "Could not change extension for " + path.string(),
            target.string()));
    }

    m_stats.files_processed++;
    m_stats.successful_operations++;
    m_logger->info("Changed extension for {} to {}", path.string(), extension);
    return OperationStatus::success("ext", path.string(), target.string());
}

std::pair<OperationStats, OperationStatus>
FileSystemManager::bulk_change_extensions(
    const std::string &directory,
    const std::vector<std::string> &current_extensions,
    const std::string &new_extension,
    bool recursive)
{
    auto [dir, status] = require_directory("bulk_ext", directory);
    if (!status.ok()) {
        return {m_stats, fail(status)};
    }

    reset_stats();

    const std::string target_extension =
        normalize_extension(trim(new_extension));
    if (target_extension == ".") {
        return {m_stats,
                fail(OperationStatus::failure(
                    FileOperationResult::FILE_SYSTEM_ERROR,
                    "bulk_ext",
                    dir.string(),
                    "Invalid extension '" + new_extension + "'"))};
    }

    std::vector<std::string> extensions;
    for (const auto &extension : current_extensions) {
        const std::string trimmed = trim(extension);
        if (!trimmed.empty()) {
            extensions.push_back(to_lower(normalize_extension(trimmed)));
        }
    }

    // Collect first so renamed files are never picked up again mid-walk
    std::vector<fs::path> matches;
    std::error_code ec;
    auto collect = [&](const fs::directory_entry &entry) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) &&
            extension_matches(entry.path(), extensions)) {
            matches.push_back(entry.path());
        }
    };

    if (recursive) {
        fs::recursive_directory_iterator it(
            dir,
            fs::directory_options::skip_permission_denied,
            ec);
        for (; !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            collect(*it);
        }
    } else {
        fs::directory_iterator it(dir, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            collect(*it);
        }
    }

    if (ec) {
        return {m_stats,
                fail(OperationStatus::from_error_code(
                    ec,
                    "bulk_ext",
                    dir.string(),
                    "Bulk extension change failed in " + dir.string()))};
    }

    std::sort(matches.begin(), matches.end());

    for (const auto &file_path : matches) {
        m_stats.files_processed++;

        fs::path target = file_path;
        target.replace_extension(target_extension);
        if (file_exists(target)) {
            m_logger->warn("Skipped {} - target exists", file_path.string());
            m_stats.failed_operations++;
            continue;
        }

        fs::rename(file_path, target, ec);
        if (ec) {
            m_logger->error("Error processing {}: {}",
                            file_path.string(),
                            ec.message());
            m_stats.failed_operations++;
            ec.clear();
            continue;
        }

        m_stats.successful_operations++;
        m_logger->info("Changed {} to {}", file_path.string(), target.string());
    }

    m_logger->info("Bulk extension change in {}: {} processed, {} changed, "
                   "{} failed",
                   dir.string(),
                   m_stats.files_processed,
                   m_stats.successful_operations,
                   m_stats.failed_operations);
    return {m_stats, status};
}

OperationStatus
FileSystemManager::create_empty_file(const std::string &file_path,
                                     const std::optional<std::string> &content)
{
    auto [path, status] = validate_path(file_path, false);
    if (!status.ok()) {
        status.operation = "create";
        return fail(status);
    }

    if (file_exists(path)) {
        return fail(
            OperationStatus::failure(FileOperationResult::FILE_SYSTEM_ERROR,
                                     "create",
                                     path.string(),
                                     "File " + path.string() +
                                         " already exists"));
    }

    const std::string extension = to_lower(path.extension().string());
    std::string data;
    if (extension == ".json") {
        data = "{}";
    } else if (extension != ".csv") {
        data = content.value_or("");
    }

    FileOperationResult result = write_file(path, data);
    if (result != FileOperationResult::SUCCESS) {
        return fail(OperationStatus::failure(
            result,
            "create",
            path.string(),
            "Could not create file " + path.string() + ": " +
                file_operation_result_to_string(result)));
    }

    m_stats.files_processed++;
    m_stats.successful_operations++;
    m_logger->info("Created file {}", path.string());
    return OperationStatus::success("create", path.string());
}

std::pair<uintmax_t, OperationStatus>
FileSystemManager::get_directory_size(const std::string &directory,
                                      bool recursive)
{
    uintmax_t total_size = 0;

    auto [dir, status] = require_directory("size", directory);
    if (!status.ok()) {
        return {total_size, fail(status)};
    }

    auto measure = [&](const fs::directory_entry &entry) {
        std::error_code entry_ec;
        const bool regular = entry.is_regular_file(entry_ec);
        if (!entry_ec && !regular) {
            return;
        }

        uintmax_t size = 0;
        if (!entry_ec) {
            size = entry.file_size(entry_ec);
        }
        if (entry_ec) {
            m_logger->warn("Could not process {}: {}",
                           entry.path().string(),
                           entry_ec.message());
            m_stats.failed_operations++;
            return;
        }

        total_size += size;
        m_stats.files_processed++;
    };

    std::error_code ec;
    if (recursive) {
        fs::recursive_directory_iterator it(
            dir,
            fs::directory_options::skip_permission_denied,
            ec);
        for (; !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_directory(type_ec)) {
                measure(*it);
            }
        }
    } else {
        fs::directory_iterator it(dir, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            measure(*it);
        }
    }

    if (ec) {
        return {total_size,
                fail(OperationStatus::from_error_code(
                    ec,
                    "size",
                    dir.string(),
                    "Could not calculate size for " + dir.string()))};
    }

    m_stats.directories_processed++;
    m_stats.successful_operations++;
    m_logger->info("Size of {} is {} bytes", dir.string(), total_size);
    return {total_size, status};
}

OperationStatus FileSystemManager::clean_directory(const std::string &directory)
{
    auto [dir, status] = require_directory("clean", directory);
    if (!status.ok()) {
        return fail(status);
    }

    if (is_filesystem_root(dir)) {
        return fail(OperationStatus::failure(
            FileOperationResult::UNSUPPORTED_OPERATION,
            "clean",
            dir.string(),
            "Refusing to clean the filesystem root"));
    }

    reset_stats();

    std::error_code ec;
    const std::vector<fs::path> children = sorted_children(dir, ec);
    if (ec) {
        return fail(OperationStatus::from_error_code(
            ec,
            "clean",
            dir.string(),
            "Could not clean directory " + dir.string()));
    }

    for (const auto &child : children) {
        const bool directory_child = is_real_directory(child);
        if (directory_child) {
            fs::remove_all(child, ec);
        } else {
            fs::remove(child, ec);
        }

        if (ec) {
            m_logger->error("Could not remove {}: {}",
                            child.string(),
                            ec.message());
            m_stats.failed_operations++;
            ec.clear();
            continue;
        }

        if (directory_child) {
            m_stats.directories_processed++;
        } else {
            m_stats.files_processed++;
        }
        m_stats.successful_operations++;
        m_logger->info("Removed {}", child.string());
    }

    m_logger->info("Cleaned directory {}", dir.string());
    return status;
}

} // namespace common
} // namespace filewarden
