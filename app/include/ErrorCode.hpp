#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <system_error>

namespace ErrorCodes {

enum class Code {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,

    // File system (1200-1299)
    FILE_NOT_FOUND = 1200,
    FILE_ACCESS_DENIED = 1201,
    FILE_PERMISSION_DENIED = 1202,
    FILE_ALREADY_EXISTS = 1203,
    FILE_READ_FAILED = 1205,
    FILE_WRITE_FAILED = 1206,
    FILE_DELETE_FAILED = 1207,
    FILE_MOVE_FAILED = 1208,
    DIRECTORY_NOT_FOUND = 1210,
    DIRECTORY_INVALID = 1211,
    DIRECTORY_ACCESS_DENIED = 1212,
    DIRECTORY_CREATE_FAILED = 1213,
    DISK_FULL = 1215,
    PATH_INVALID = 1217,

    // Configuration (1500-1599)
    CONFIG_INVALID = 1500,
    CONFIG_PARSE_ERROR = 1502,
    CONFIG_SAVE_FAILED = 1503,
    CONFIG_LOAD_FAILED = 1504,

    // Validation (1600-1699)
    VALIDATION_INVALID_INPUT = 1600,
    VALIDATION_EMPTY_FIELD = 1604,
    VALIDATION_VALUE_OUT_OF_RANGE = 1605,
    VALIDATION_INVALID_FOLDER_NAME = 1606,
    VALIDATION_UNKNOWN_ENTRY = 1607,

    // Organize / apply (1800-1899)
    ORGANIZE_NO_FILES = 1800,
    ORGANIZE_PARTIAL_FAILURE = 1802,
    ORGANIZE_STALE_PLAN = 1805,
    ORGANIZE_COLLISION_EXHAUSTED = 1806,
    ORGANIZE_TRASH_FAILED = 1807,
    ORGANIZE_OPERATION_IN_PROGRESS = 1808,
    ORGANIZE_YEAR_REQUIRED = 1809,
    ORGANIZE_FOLDER_REQUIRED = 1810
};

struct ErrorInfo {
    Code code;
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo(Code code,
              std::string message,
              std::string resolution,
              std::string context = "");

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // Code, message, resolution and technical context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");

    // Maps an OS error reported by std::filesystem onto the catalog
    static Code from_error_code(const std::error_code& ec, Code fallback);
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
