#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"

namespace fs = std::filesystem;

enum class FileScanOptions {
    None        = 0,
    Files       = 1 << 0,   // 0001
    Directories = 1 << 1,   // 0010
    HiddenFiles = 1 << 2    // 0100
};

inline bool has_flag(FileScanOptions value, FileScanOptions flag) {
    return (static_cast<int>(value) & static_cast<int>(flag)) != 0;
}

inline FileScanOptions operator|(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) | static_cast<int>(b));
}

/**
 * @brief Lists one directory level, dropping junk and (optionally) hidden entries.
 *
 * Throws std::filesystem::filesystem_error when the directory cannot be opened.
 * Results are sorted by name so repeated listings compare equal.
 */
class FileScanner {
public:
    FileScanner() = default;
    std::vector<DirectoryItem>
        get_directory_entries(const std::string &directory_path,
                              FileScanOptions options) const;

private:
    struct ScanContext;
    std::optional<DirectoryItem> build_entry(const fs::directory_entry& entry,
                                             const ScanContext& context) const;
    bool should_skip_entry(const fs::path& entry_path,
                           const std::string& file_name,
                           const ScanContext& context,
                           const std::string& full_path) const;
    std::optional<FileType> classify_entry(const fs::directory_entry& entry,
                                           const ScanContext& context) const;
    bool is_file_hidden(const fs::path &path) const;
    bool is_junk_file(const std::string& name) const;
};

#endif
