#include "common/file_operations.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace filewarden {
namespace common {

std::string file_operation_result_to_string(FileOperationResult result)
{
    switch (result) {
    case FileOperationResult::SUCCESS:
        return "success";
    case FileOperationResult::PATH_NOT_FOUND:
        return "path not found";
    case FileOperationResult::PERMISSION_DENIED:
        return "permission denied";
    case FileOperationResult::NOT_EMPTY_DIRECTORY:
        return "directory not empty";
    case FileOperationResult::UNSUPPORTED_OPERATION:
        return "unsupported operation";
    case FileOperationResult::FILE_SYSTEM_ERROR:
        return "file system error";
    default:
        return "unrecognized error";
    }
}

FileOperationResult
system_error_to_file_operation_result(const std::error_code &ec)
{
    if (!ec) {
        return FileOperationResult::SUCCESS;
    }

    switch (static_cast<std::errc>(ec.value())) {
    case std::errc::no_such_file_or_directory:
        return FileOperationResult::PATH_NOT_FOUND;

    case std::errc::permission_denied:
    case std::errc::operation_not_permitted:
        return FileOperationResult::PERMISSION_DENIED;

    case std::errc::directory_not_empty:
        return FileOperationResult::NOT_EMPTY_DIRECTORY;

    case std::errc::operation_not_supported:
        return FileOperationResult::UNSUPPORTED_OPERATION;

    default:
        return FileOperationResult::FILE_SYSTEM_ERROR;
    }
}

std::string OperationStatus::to_string() const
{
    return file_operation_result_to_string(result) + ": " + message;
}

OperationStatus OperationStatus::success(const std::string &operation,
                                         const std::string &path,
                                         const std::string &target)
{
    OperationStatus status;
    status.operation = operation;
    status.path = path;
    status.target = target;
    return status;
}

OperationStatus OperationStatus::failure(FileOperationResult result,
                                         const std::string &operation,
                                         const std::string &path,
                                         const std::string &message,
                                         const std::string &target)
{
    OperationStatus status;
    status.result = result;
    status.operation = operation;
    status.path = path;
    status.target = target;
    status.message = message;
    return status;
}

OperationStatus OperationStatus::from_error_code(const std::error_code &ec,
                                                 const std::string &operation,
                                                 const std::string &path,
                                                 const std::string &message,
                                                 const std::string &target)
{
    OperationStatus status = failure(system_error_to_file_operation_result(ec),
                                     operation,
                                     path,
                                     message + ": " + ec.message(),
                                     target);
    // A cleared error code still means the operation failed
    if (status.ok()) {
        status.result = FileOperationResult::FILE_SYSTEM_ERROR;
    }
    status.error_code = ec.value();
    return status;
}

std::pair<FileInfo, FileOperationResult>
get_file_info(const fs::path &filepath)
{
    FileInfo file_info;
    struct stat st {};

    if (::stat(filepath.c_str(), &st) != 0) {
        std::error_code ec(errno, std::generic_category());
        return {file_info, system_error_to_file_operation_result(ec)};
    }

    file_info.path = filepath.string();
    file_info.name = filepath.filename().string();
    file_info.size = static_cast<uintmax_t>(st.st_size);
    file_info.created_time = static_cast<int64_t>(st.st_ctime);
    file_info.modified_time = static_cast<int64_t>(st.st_mtime);
    file_info.accessed_time = static_cast<int64_t>(st.st_atime);
    file_info.is_directory = S_ISDIR(st.st_mode);
    file_info.is_file = S_ISREG(st.st_mode);

    return {file_info, FileOperationResult::SUCCESS};
}

FileOperationResult write_file(const fs::path &filepath,
                               const std::string &data)
{
    std::error_code ec;

    fs::path parent_path = filepath.parent_path();
    if (!parent_path.empty() && !fs::exists(parent_path, ec)) {
        return FileOperationResult::PATH_NOT_FOUND;
    }

    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file) {
        if (errno == EACCES || errno == EPERM) {
            return FileOperationResult::PERMISSION_DENIED;
        }
        return FileOperationResult::FILE_SYSTEM_ERROR;
    }

    if (!file.write(data.data(), static_cast<std::streamsize>(data.size()))) {
        return FileOperationResult::FILE_SYSTEM_ERROR;
    }

    return FileOperationResult::SUCCESS;
}

bool file_exists(const fs::path &filepath)
{
    std::error_code ec;
    fs::file_status status = fs::symlink_status(filepath, ec);
    return !ec && fs::exists(status);
}

std::string normalize_extension(const std::string &extension)
{
    if (!extension.empty() && extension.front() == '.') {
        return extension;
    }
    return "." + extension;
}

std::string trim(const std::string &text)
{
    const auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c));
    };
    const auto first = std::find_if_not(text.begin(), text.end(), is_space);
    const auto last =
        std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string to_lower(std::string text)
{
    std::transform(text.begin(),
                   text.end(),
                   text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool extension_matches(const fs::path &filepath,
                       const std::vector<std::string> &extensions)
{
    const std::string extension = to_lower(filepath.extension().string());
    if (extension.empty()) {
        return false;
    }
    return std::find(extensions.begin(), extensions.end(), extension) !=
           extensions.end();
}

} // namespace common
} // namespace filewarden
