#ifndef SCAN_ENGINE_HPP
#define SCAN_ENGINE_HPP

#include "DuplicateResolver.hpp"
#include "FileScanner.hpp"
#include "PathClassifier.hpp"
#include "Types.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace spdlog { class logger; }

struct ScanOptions {
    bool include_other_files{false};
};

/**
 * @brief Snapshot of a camera folder taken by one ScanEngine::scan() call.
 */
struct Inventory {
    std::string root;
    std::vector<FileEntry> pending;          ///< Loose files in the root, capture order.
    std::vector<OrganizedFolder> folders;    ///< YEAR/FOLDER directories, year then name.
    DuplicateReport duplicates;
    std::vector<std::string> warnings;       ///< Subdirectories that could not be read.
    std::size_t skipped_other_files{0};
    std::size_t unfiled_year_files{0};       ///< Files lying directly in a YEAR directory.

    FileEntry* find(const std::string& identity);
    const FileEntry* find(const std::string& identity) const;
    const OrganizedFolder* find_folder(int year, const std::string& name) const;
};

/**
 * @brief Walks root, YEAR/ and YEAR/FOLDER/ once and returns an annotated Inventory.
 *
 * The engine keeps no state between calls and never writes to the disk, so it can
 * run on a worker thread while the caller keeps its previous inventory.
 */
class ScanEngine {
public:
    ScanEngine(const IPathClassifier& classifier,
               std::shared_ptr<spdlog::logger> logger);

    // Throws ErrorCodes::AppException when root is missing, not a directory, or unreadable.
    Inventory scan(const std::string& root_path,
                   const std::set<std::string>& ignored,
                   const ScanOptions& options = {}) const;

private:
    void validate_root(const std::string& root_path) const;
    void collect_root(const std::string& root_path,
                      const ScanOptions& options,
                      Inventory& inventory,
                      std::vector<DirectoryItem>& year_dirs) const;
    void collect_year(const DirectoryItem& year_dir, Inventory& inventory) const;
    void collect_folder(int year, const DirectoryItem& folder_dir, Inventory& inventory) const;
    FileEntry make_entry(const DirectoryItem& item, MediaKind kind) const;
    void warn(Inventory& inventory, const std::string& message) const;

    const IPathClassifier& classifier;
    std::shared_ptr<spdlog::logger> logger;
    FileScanner scanner;
    DuplicateResolver resolver;
};

#endif
