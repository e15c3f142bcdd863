#include "ErrorCode.hpp"

#include <fmt/format.h>

#include <unordered_map>
#include <utility>

namespace ErrorCodes {

namespace {

struct CatalogText {
    const char* message;
    const char* resolution;
};

const std::unordered_map<Code, CatalogText>& catalog()
{
    static const std::unordered_map<Code, CatalogText> entries = {
        {Code::SUCCESS, {"Operation completed successfully.", ""}},
        {Code::UNKNOWN_ERROR, {"An unexpected error occurred.",
            "Check the log file for details and try again."}},

        {Code::FILE_NOT_FOUND, {"The file could not be found.",
            "Rescan the camera folder; the file may have been moved or deleted."}},
        {Code::FILE_ACCESS_DENIED, {"Access to the file was denied.",
            "Close any program that keeps the file open and retry."}},
        {Code::FILE_PERMISSION_DENIED, {"You do not have permission to modify this file.",
            "Check the file permissions of the camera folder."}},
        {Code::FILE_ALREADY_EXISTS, {"A file with the same name already exists at the destination.",
            "Rename or remove the existing file and retry."}},
        {Code::FILE_READ_FAILED, {"The file could not be read.",
            "Check that the drive is connected and readable."}},
        {Code::FILE_WRITE_FAILED, {"The file could not be written.",
            "Check free disk space and write permissions."}},
        {Code::FILE_DELETE_FAILED, {"The file could not be deleted.",
            "Close any program that uses the file and retry."}},
        {Code::FILE_MOVE_FAILED, {"The file could not be moved.",
            "Check that the destination drive is writable and retry."}},
        {Code::DIRECTORY_NOT_FOUND, {"The camera folder does not exist.",
            "Select an existing folder with 'set-root'."}},
        {Code::DIRECTORY_INVALID, {"The selected path is not a directory.",
            "Select a folder, not a file."}},
        {Code::DIRECTORY_ACCESS_DENIED, {"The folder could not be opened.",
            "Check the folder permissions."}},
        {Code::DIRECTORY_CREATE_FAILED, {"A destination folder could not be created.",
            "Check write permissions for the camera folder."}},
        {Code::DISK_FULL, {"The disk is full.",
            "Free some space and retry."}},
        {Code::PATH_INVALID, {"The path is invalid.",
            "Use a path without reserved characters."}},

        {Code::CONFIG_INVALID, {"The configuration is invalid.",
            "Delete config.json to restore defaults."}},
        {Code::CONFIG_PARSE_ERROR, {"A settings document could not be parsed.",
            "The damaged document was kept with a .corrupt suffix."}},
        {Code::CONFIG_SAVE_FAILED, {"Settings could not be saved.",
            "Check write permissions for the configuration directory."}},
        {Code::CONFIG_LOAD_FAILED, {"Settings could not be loaded.",
            "Check read permissions for the configuration directory."}},

        {Code::VALIDATION_INVALID_INPUT, {"The input is invalid.", ""}},
        {Code::VALIDATION_EMPTY_FIELD, {"A required value is empty.",
            "Enter a value and retry."}},
        {Code::VALIDATION_VALUE_OUT_OF_RANGE, {"The value is out of range.",
            "Years must lie between 1900 and 2099."}},
        {Code::VALIDATION_INVALID_FOLDER_NAME, {"The folder name is not allowed.",
            "Folder names cannot be empty, contain path separators or start with '!'."}},
        {Code::VALIDATION_UNKNOWN_ENTRY, {"The file is not part of the current scan.",
            "Rescan the camera folder and retry."}},

        {Code::ORGANIZE_NO_FILES, {"There are no files to organize.", ""}},
        {Code::ORGANIZE_PARTIAL_FAILURE, {"Some files could not be organized.",
            "Review the failed entries and retry."}},
        {Code::ORGANIZE_STALE_PLAN, {"The folder changed since the plan was computed.",
            "Rescan the camera folder and retry."}},
        {Code::ORGANIZE_COLLISION_EXHAUSTED, {"No free destination name could be found.",
            "Clean up the destination folder and retry."}},
        {Code::ORGANIZE_TRASH_FAILED, {"The file could not be moved to the trash.",
            "Check that the system trash is available for this drive."}},
        {Code::ORGANIZE_OPERATION_IN_PROGRESS, {"Another scan or apply is already running.",
            "Wait for the running operation to finish."}},
        {Code::ORGANIZE_YEAR_REQUIRED, {"The year of this file is unknown.",
            "Set the year manually before organizing."}},
        {Code::ORGANIZE_FOLDER_REQUIRED, {"No destination folder is assigned.",
            "Assign a folder before organizing."}},
    };
    return entries;
}

} // namespace

ErrorInfo::ErrorInfo(Code code,
                     std::string message,
                     std::string resolution,
                     std::string context)
    : code(code),
      message(std::move(message)),
      resolution(std::move(resolution)),
      context(std::move(context))
{
}

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n" + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("Error {}: {}", static_cast<int>(code), message);
    if (!resolution.empty()) {
        details += fmt::format("\nResolution: {}", resolution);
    }
    if (!context.empty()) {
        details += fmt::format("\nDetails: {}", context);
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    if (auto it = entries.find(code); it != entries.end()) {
        return ErrorInfo(code, it->second.message, it->second.resolution, context);
    }
    const auto& unknown = entries.at(Code::UNKNOWN_ERROR);
    return ErrorInfo(code, unknown.message, unknown.resolution, context);
}

Code ErrorCatalog::from_error_code(const std::error_code& ec, Code fallback)
{
    if (!ec) {
        return Code::SUCCESS;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return Code::FILE_PERMISSION_DENIED;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return Code::FILE_NOT_FOUND;
    }
    if (ec == std::errc::file_exists) {
        return Code::FILE_ALREADY_EXISTS;
    }
    if (ec == std::errc::no_space_on_device) {
        return Code::DISK_FULL;
    }
    if (ec == std::errc::device_or_resource_busy || ec == std::errc::text_file_busy) {
        return Code::FILE_ACCESS_DENIED;
    }
    return fallback;
}

} // namespace ErrorCodes
