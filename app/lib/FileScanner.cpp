#include "FileScanner.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <filesystem>
#include <optional>
#include <unordered_set>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

struct FileScanner::ScanContext {
    bool include_files{false};
    bool include_directories{false};
    bool include_hidden{false};
    std::shared_ptr<spdlog::logger> logger;
};

std::vector<DirectoryItem>
FileScanner::get_directory_entries(const std::string &directory_path,
                                   FileScanOptions options) const
{
    std::vector<DirectoryItem> items;
    auto logger = Logger::get_logger("core_logger");

    if (logger) {
        logger->trace("Listing '{}' with options mask {}", directory_path, static_cast<int>(options));
    }

    ScanContext context;
    context.include_files = has_flag(options, FileScanOptions::Files);
    context.include_directories = has_flag(options, FileScanOptions::Directories);
    context.include_hidden = has_flag(options, FileScanOptions::HiddenFiles);
    context.logger = logger;

    try {
        const fs::path scan_path = Utils::utf8_to_path(directory_path);
        for (const auto &entry : fs::directory_iterator(scan_path)) {
            if (auto item = build_entry(entry, context)) {
                items.push_back(std::move(*item));
            }
        }
    } catch (const fs::filesystem_error& ex) {
        if (logger) {
            logger->warn("Error while listing '{}': {}", directory_path, ex.what());
        }
        throw;
    }

    std::sort(items.begin(), items.end(),
              [](const DirectoryItem& lhs, const DirectoryItem& rhs) {
                  return lhs.file_name < rhs.file_name;
              });
    return items;
}


bool FileScanner::is_file_hidden(const fs::path &path) const {
#ifdef _WIN32
    DWORD attrs = GetFileAttributesW(path.c_str());
    return (attrs != INVALID_FILE_ATTRIBUTES) &&
           (attrs & FILE_ATTRIBUTE_HIDDEN);
#else
    return path.filename().string().starts_with(".");
#endif
}


bool FileScanner::is_junk_file(const std::string& name) const {
    static const std::unordered_set<std::string> junk = {
        ".DS_Store", "Thumbs.db", "desktop.ini", ".nomedia"
    };
    return junk.contains(name);
}


std::optional<DirectoryItem> FileScanner::build_entry(const fs::directory_entry& entry,
                                                      const ScanContext& context) const
{
    const fs::path& entry_path = entry.path();
    std::string full_path = Utils::path_to_utf8(entry_path);
    std::string file_name = Utils::path_to_utf8(entry_path.filename());

    if (should_skip_entry(entry_path, file_name, context, full_path)) {
        return std::nullopt;
    }

    if (auto type = classify_entry(entry, context)) {
        return DirectoryItem{std::move(full_path), std::move(file_name), *type};
    }
    return std::nullopt;
}

bool FileScanner::should_skip_entry(const fs::path& entry_path,
                                    const std::string& file_name,
                                    const ScanContext& context,
                                    const std::string& full_path) const
{
    if (is_junk_file(file_name)) {
        return true;
    }

    if (is_file_hidden(entry_path) && !context.include_hidden) {
        if (context.logger) {
            context.logger->trace("Skipping hidden entry '{}'", full_path);
        }
        return true;
    }

    return false;
}

std::optional<FileType> FileScanner::classify_entry(const fs::directory_entry& entry,
                                                    const ScanContext& context) const
{
    std::error_code ec;
    if (context.include_files && entry.is_regular_file(ec)) {
        return FileType::File;
    }

    if (context.include_directories && entry.is_directory(ec)) {
        return FileType::Directory;
    }

    return std::nullopt;
}
