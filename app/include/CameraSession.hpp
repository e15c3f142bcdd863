#ifndef CAMERA_SESSION_HPP
#define CAMERA_SESSION_HPP

#include "ApplyEngine.hpp"
#include "DuplicateResolver.hpp"
#include "EditSessionStore.hpp"
#include "IgnoreList.hpp"
#include "PathClassifier.hpp"
#include "PlacementPlanner.hpp"
#include "ScanEngine.hpp"
#include "Types.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

class ITrash;
class Settings;

struct BlockedEntry {
    std::string identity;
    PlanStatus status{PlanStatus::NeedsYear};
};

struct BatchPlan {
    std::vector<PlannedMove> moves;
    std::vector<BlockedEntry> blocked;  ///< Entries that still need a year or a folder.
};

/**
 * @brief Owns everything known about one camera folder between two scans.
 *
 * All mutations go through this class on the caller's thread. Only scan_async()
 * does work elsewhere, and its result is not visible until adopt() is called.
 * At most one scan or batch operation runs at a time; a second one throws
 * ORGANIZE_OPERATION_IN_PROGRESS.
 */
class CameraSession {
public:
    CameraSession(Settings& settings, const IPathClassifier& classifier, ITrash& trash);

    // Reads edits.json and ignore.json from the settings' config directory.
    void load_state();

    std::string root() const;
    // Validates, stores and saves a new camera folder; the current inventory is dropped.
    void set_root(const std::string& path);

    const Inventory& scan();
    // The session must outlive the returned future. A successful result has to be
    // passed to adopt(); until then every other scan or batch is rejected.
    std::future<Inventory> scan_async();
    void adopt(Inventory inventory);

    bool has_inventory() const { return inventory_.has_value(); }
    // Throws ORGANIZE_NO_FILES when nothing was scanned yet.
    const Inventory& inventory() const;

    void assign_folder(const std::vector<std::string>& identities, const std::string& folder);
    void set_year(const std::vector<std::string>& identities, int year);
    void set_category(const std::vector<std::string>& identities, MediaCategory category);
    void clear_assignment(const std::vector<std::string>& identities);

    BatchPlan plan() const;
    ApplySummary apply();
    ApplySummary auto_organize();
    ApplySummary delete_entries(const std::vector<std::string>& identities);
    ApplySummary purge_redundant_copies();

    bool ignore(const std::string& identity);
    bool unignore(const std::string& identity);
    std::vector<ConflictRecord> conflicts(bool include_ignored = false) const;

    std::vector<OrganizedFolder> list_folders(int year) const;
    OrganizedFolder create_folder(int year, const std::string& name);

    std::vector<std::string> orphaned_edits() const;
    std::size_t prune_frame_cache() const;

    const EditSessionStore& edits() const { return edits_; }
    const IgnoreList& ignore_list() const { return ignore_list_; }

private:
    class OperationGuard {
    public:
        explicit OperationGuard(std::atomic<bool>& busy);
        ~OperationGuard();
        OperationGuard(const OperationGuard&) = delete;
        OperationGuard& operator=(const OperationGuard&) = delete;
    private:
        std::atomic<bool>& busy;
    };

    Inventory& current();
    std::vector<FileEntry*> require_entries(const std::vector<std::string>& identities);
    EditRecord edit_for(const FileEntry& entry) const;
    void store_edit(const FileEntry& entry);
    void save_edits() const;
    void merge_edits(Inventory& inventory) const;
    void refresh_annotations();
    BatchPlan plan_entries(const std::vector<const FileEntry*>& entries) const;
    ApplySummary run_batch(const std::vector<PlannedMove>& moves, bool track_edits);
    void record_applied(const ApplySummary& summary);
    ScanOptions scan_options() const;

    Settings& settings;
    const IPathClassifier& classifier;
    ITrash& trash;
    std::shared_ptr<spdlog::logger> logger;
    EditSessionStore edits_;
    IgnoreList ignore_list_;
    std::optional<Inventory> inventory_;
    std::atomic<bool> busy{false};
    std::atomic<bool> awaiting_adopt{false};
};

#endif
