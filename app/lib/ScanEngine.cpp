#include "ScanEngine.hpp"
#include "AppException.hpp"
#include "FolderCatalog.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

bool pending_less(const FileEntry& lhs, const FileEntry& rhs)
{
    // Entries without a capture time come first, like the camera roll listing
    if (lhs.capture_time.has_value() != rhs.capture_time.has_value()) {
        return !lhs.capture_time.has_value();
    }
    if (lhs.capture_time && *lhs.capture_time != *rhs.capture_time) {
        return *lhs.capture_time < *rhs.capture_time;
    }
    return lhs.identity < rhs.identity;
}

bool folder_less(const OrganizedFolder& lhs, const OrganizedFolder& rhs)
{
    if (lhs.year != rhs.year) {
        return lhs.year < rhs.year;
    }
    return lhs.name < rhs.name;
}

} // namespace


FileEntry* Inventory::find(const std::string& identity)
{
    auto it = std::find_if(pending.begin(), pending.end(),
                           [&identity](const FileEntry& entry) { return entry.identity == identity; });
    return it == pending.end() ? nullptr : &*it;
}

const FileEntry* Inventory::find(const std::string& identity) const
{
    auto it = std::find_if(pending.begin(), pending.end(),
                           [&identity](const FileEntry& entry) { return entry.identity == identity; });
    return it == pending.end() ? nullptr : &*it;
}

const OrganizedFolder* Inventory::find_folder(int year, const std::string& name) const
{
    auto it = std::find_if(folders.begin(), folders.end(),
                           [year, &name](const OrganizedFolder& folder) {
                               return folder.year == year && folder.name == name;
                           });
    return it == folders.end() ? nullptr : &*it;
}


ScanEngine::ScanEngine(const IPathClassifier& classifier,
                       std::shared_ptr<spdlog::logger> logger)
    : classifier(classifier),
      logger(std::move(logger))
{
}


Inventory ScanEngine::scan(const std::string& root_path,
                           const std::set<std::string>& ignored,
                           const ScanOptions& options) const
{
    validate_root(root_path);

    Inventory inventory;
    inventory.root = root_path;
    if (logger) {
        logger->info("Scanning camera folder '{}'", root_path);
    }

    std::vector<DirectoryItem> year_dirs;
    collect_root(root_path, options, inventory, year_dirs);
    for (const auto& year_dir : year_dirs) {
        collect_year(year_dir, inventory);
    }

    std::sort(inventory.pending.begin(), inventory.pending.end(), pending_less);
    std::sort(inventory.folders.begin(), inventory.folders.end(), folder_less);

    inventory.duplicates = resolver.resolve(inventory.pending, inventory.folders, ignored);

    if (logger) {
        logger->info("Scan complete: {} file(s) to organize, {} folder(s), {} warning(s)",
                     inventory.pending.size(), inventory.folders.size(), inventory.warnings.size());
    }
    return inventory;
}


void ScanEngine::validate_root(const std::string& root_path) const
{
    std::error_code ec;
    const fs::path root = Utils::utf8_to_path(root_path);
    if (root_path.empty() || !fs::exists(root, ec)) {
        if (logger) {
            logger->error("Camera folder '{}' does not exist", root_path);
        }
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_NOT_FOUND, root_path);
    }
    if (!fs::is_directory(root, ec)) {
        if (logger) {
            logger->error("Camera folder '{}' is not a directory", root_path);
        }
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_INVALID, root_path);
    }
}


void ScanEngine::collect_root(const std::string& root_path,
                              const ScanOptions& options,
                              Inventory& inventory,
                              std::vector<DirectoryItem>& year_dirs) const
{
    std::vector<DirectoryItem> items;
    try {
        items = scanner.get_directory_entries(root_path,
            FileScanOptions::Files | FileScanOptions::Directories);
    } catch (const fs::filesystem_error& ex) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_ACCESS_DENIED, ex.what());
    }

    for (const auto& item : items) {
        if (item.type == FileType::Directory) {
            if (PathRules::is_year_folder_name(item.file_name)) {
                year_dirs.push_back(item);
            } else if (logger) {
                logger->trace("Ignoring root directory '{}'", item.file_name);
            }
            continue;
        }

        const MediaKind kind = classifier.kind_of(item.file_name);
        if (kind == MediaKind::Other && !options.include_other_files) {
            ++inventory.skipped_other_files;
            continue;
        }
        inventory.pending.push_back(make_entry(item, kind));
    }
}


void ScanEngine::collect_year(const DirectoryItem& year_dir, Inventory& inventory) const
{
    const int year = std::stoi(year_dir.file_name);
    std::vector<DirectoryItem> items;
    try {
        items = scanner.get_directory_entries(year_dir.full_path,
            FileScanOptions::Files | FileScanOptions::Directories);
    } catch (const fs::filesystem_error& ex) {
        warn(inventory, "Skipped unreadable year folder '" + year_dir.full_path + "': " + ex.what());
        return;
    }

    for (const auto& item : items) {
        if (item.type == FileType::File) {
            ++inventory.unfiled_year_files;
            continue;
        }
        if (PathRules::is_reserved_folder_name(item.file_name)
            && !PathRules::is_auto_category_folder_name(item.file_name)) {
            continue;
        }
        collect_folder(year, item, inventory);
    }
}


void ScanEngine::collect_folder(int year, const DirectoryItem& folder_dir, Inventory& inventory) const
{
    OrganizedFolder folder;
    folder.year = year;
    folder.name = folder_dir.file_name;
    folder.path = folder_dir.full_path;
    folder.auto_category = PathRules::is_auto_category_folder_name(folder_dir.file_name);
    folder.color_tag = FolderCatalog::color_tag_for(folder.name);

    try {
        for (const auto& item : scanner.get_directory_entries(folder_dir.full_path, FileScanOptions::Files)) {
            folder.members.insert(item.file_name);
        }
    } catch (const fs::filesystem_error& ex) {
        warn(inventory, "Skipped unreadable folder '" + folder_dir.full_path + "': " + ex.what());
        return;
    }
    inventory.folders.push_back(std::move(folder));
}


FileEntry ScanEngine::make_entry(const DirectoryItem& item, MediaKind kind) const
{
    const Classification classification = classifier.classify(item.file_name);

    FileEntry entry;
    entry.identity = item.file_name;
    entry.source_path = item.full_path;
    entry.kind = kind;
    entry.year = classification.year;
    entry.category = classification.category;
    entry.capture_time = classification.capture_time;

    std::error_code ec;
    const auto size = fs::file_size(Utils::utf8_to_path(item.full_path), ec);
    entry.size_bytes = ec ? 0 : size;
    entry.state = derive_state(entry);
    return entry;
}


void ScanEngine::warn(Inventory& inventory, const std::string& message) const
{
    if (logger) {
        logger->warn("{}", message);
    }
    inventory.warnings.push_back(message);
}
