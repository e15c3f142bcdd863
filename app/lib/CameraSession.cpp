#include "CameraSession.hpp"
#include "AppException.hpp"
#include "FolderCatalog.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "Trash.hpp"
#include "Utils.hpp"
#include "VideoFrameCache.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <set>
#include <system_error>
#include <utility>


namespace {

void sort_folders(std::vector<OrganizedFolder>& folders)
{
    std::sort(folders.begin(), folders.end(),
              [](const OrganizedFolder& lhs, const OrganizedFolder& rhs) {
                  if (lhs.year != rhs.year) {
                      return lhs.year < rhs.year;
                  }
                  return lhs.name < rhs.name;
              });
}

ApplyResult blocked_result(const BlockedEntry& blocked)
{
    ApplyResult result;
    result.identity = blocked.identity;
    switch (blocked.status) {
        case PlanStatus::NeedsYear:
            result.outcome = ApplyOutcome::Skipped;
            result.code = ErrorCodes::Code::ORGANIZE_YEAR_REQUIRED;
            result.reason = "no year assigned";
            break;
        case PlanStatus::NeedsFolder:
            result.outcome = ApplyOutcome::Skipped;
            result.code = ErrorCodes::Code::ORGANIZE_FOLDER_REQUIRED;
            result.reason = "no folder assigned";
            break;
        case PlanStatus::CollisionExhausted:
        case PlanStatus::Ready:
            result.outcome = ApplyOutcome::Failed;
            result.code = ErrorCodes::Code::ORGANIZE_COLLISION_EXHAUSTED;
            result.reason = "no free target name";
            break;
    }
    return result;
}

} // namespace


CameraSession::OperationGuard::OperationGuard(std::atomic<bool>& busy)
    : busy(busy)
{
    bool expected = false;
    if (!busy.compare_exchange_strong(expected, true)) {
        THROW_APP_ERROR(ErrorCodes::Code::ORGANIZE_OPERATION_IN_PROGRESS, "");
    }
}

CameraSession::OperationGuard::~OperationGuard()
{
    busy.store(false);
}


CameraSession::CameraSession(Settings& settings, const IPathClassifier& classifier, ITrash& trash)
    : settings(settings),
      classifier(classifier),
      trash(trash),
      logger(Logger::get_logger("core_logger")),
      edits_(settings.get_config_dir()),
      ignore_list_(settings.get_config_dir())
{
}


void CameraSession::load_state()
{
    if (!edits_.load() && logger) {
        logger->warn("Continuing with an empty edit session");
    }
    if (!ignore_list_.load() && logger) {
        logger->warn("Continuing with an empty ignore list");
    }
}


std::string CameraSession::root() const
{
    return settings.get_camera_path();
}


void CameraSession::set_root(const std::string& path)
{
    if (!Utils::is_valid_directory(path)) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_NOT_FOUND, path);
    }
    settings.set_camera_path(path);
    if (!settings.save()) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, path);
    }
    inventory_.reset();
    if (logger) {
        logger->info("Camera folder set to '{}'", path);
    }
}


const Inventory& CameraSession::scan()
{
    Inventory fresh;
    {
        OperationGuard guard(busy);
        ScanEngine engine(classifier, logger);
        fresh = engine.scan(root(), ignore_list_.identities(), scan_options());
    }
    adopt(std::move(fresh));
    return *inventory_;
}


std::future<Inventory> CameraSession::scan_async()
{
    bool expected = false;
    if (!busy.compare_exchange_strong(expected, true)) {
        THROW_APP_ERROR(ErrorCodes::Code::ORGANIZE_OPERATION_IN_PROGRESS, "");
    }

    // The worker only sees copies, never the session's inventory or stores
    std::string root_path = root();
    std::set<std::string> ignored = ignore_list_.identities();
    const ScanOptions options = scan_options();

    // A successful scan keeps the session busy until adopt(), so no batch can run
    // against the inventory the result is about to replace
    awaiting_adopt.store(true);
    try {
        return std::async(std::launch::async,
            [this, root_path = std::move(root_path), ignored = std::move(ignored), options]() {
                try {
                    ScanEngine engine(classifier, logger);
                    return engine.scan(root_path, ignored, options);
                } catch (...) {
                    awaiting_adopt.store(false);
                    busy.store(false);
                    throw;
                }
            });
    } catch (const std::system_error&) {
        awaiting_adopt.store(false);
        busy.store(false);
        throw;
    }
}


void CameraSession::adopt(Inventory inventory)
{
    if (awaiting_adopt.exchange(false)) {
        busy.store(false);
    }
    merge_edits(inventory);
    inventory_ = std::move(inventory);
    refresh_annotations();

    if (logger) {
        const auto orphans = orphaned_edits();
        if (!orphans.empty()) {
            logger->info("{} saved edit(s) refer to files that are no longer pending", orphans.size());
        }
    }
}


const Inventory& CameraSession::inventory() const
{
    if (!inventory_) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::ORGANIZE_NO_FILES,
                            "The camera folder has not been scanned yet", root());
    }
    return *inventory_;
}


Inventory& CameraSession::current()
{
    if (!inventory_) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::ORGANIZE_NO_FILES,
                            "The camera folder has not been scanned yet", root());
    }
    return *inventory_;
}


void CameraSession::assign_folder(const std::vector<std::string>& identities, const std::string& folder)
{
    if (folder.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_EMPTY_FIELD, "folder");
    }
    if (!FolderCatalog::is_valid_folder_name(folder)
        && !PathRules::is_auto_category_folder_name(folder)) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_FOLDER_NAME, folder);
    }

    for (auto* entry : require_entries(identities)) {
        entry->assigned_folder = folder;
        store_edit(*entry);
    }
    save_edits();
    refresh_annotations();
}


void CameraSession::set_year(const std::vector<std::string>& identities, int year)
{
    if (!PathRules::is_valid_year(year)) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE, std::to_string(year));
    }

    for (auto* entry : require_entries(identities)) {
        entry->year = year;
        store_edit(*entry);
    }
    save_edits();
    refresh_annotations();
}


void CameraSession::set_category(const std::vector<std::string>& identities, MediaCategory category)
{
    for (auto* entry : require_entries(identities)) {
        entry->category = category;
        store_edit(*entry);
    }
    save_edits();
    refresh_annotations();
}


void CameraSession::clear_assignment(const std::vector<std::string>& identities)
{
    for (auto* entry : require_entries(identities)) {
        const Classification derived = classifier.classify(entry->identity);
        entry->year = derived.year;
        entry->category = derived.category;
        entry->assigned_folder.clear();
        edits_.remove(entry->identity);
    }
    save_edits();
    refresh_annotations();
}


BatchPlan CameraSession::plan() const
{
    std::vector<const FileEntry*> entries;
    for (const auto& entry : inventory().pending) {
        entries.push_back(&entry);
    }
    return plan_entries(entries);
}


ApplySummary CameraSession::apply()
{
    OperationGuard guard(busy);
    const BatchPlan batch = plan();

    ApplySummary summary = run_batch(batch.moves, true);
    for (const auto& blocked : batch.blocked) {
        summary.results.push_back(blocked_result(blocked));
    }
    record_applied(summary);
    return summary;
}


ApplySummary CameraSession::auto_organize()
{
    OperationGuard guard(busy);

    std::vector<const FileEntry*> entries;
    for (const auto& entry : current().pending) {
        if (entry.category != MediaCategory::Normal && entry.assigned_folder.empty()) {
            entries.push_back(&entry);
        }
    }
    if (logger) {
        logger->info("Auto-organizing {} screenshot/screen recording file(s)", entries.size());
    }

    const BatchPlan batch = plan_entries(entries);
    ApplySummary summary = run_batch(batch.moves, true);
    for (const auto& blocked : batch.blocked) {
        summary.results.push_back(blocked_result(blocked));
    }
    record_applied(summary);
    return summary;
}


ApplySummary CameraSession::delete_entries(const std::vector<std::string>& identities)
{
    OperationGuard guard(busy);
    Inventory& inventory = current();

    std::vector<PlannedMove> moves;
    ApplySummary unknown;
    for (const auto& identity : identities) {
        const FileEntry* entry = inventory.find(identity);
        if (!entry) {
            ApplyResult result;
            result.identity = identity;
            result.action = PlanAction::Trash;
            result.outcome = ApplyOutcome::Failed;
            result.code = ErrorCodes::Code::VALIDATION_UNKNOWN_ENTRY;
            result.reason = "not a pending file";
            unknown.results.push_back(std::move(result));
            continue;
        }
        PlannedMove move;
        move.identity = entry->identity;
        move.source_path = entry->source_path;
        move.action = PlanAction::Trash;
        move.kind = entry->kind;
        moves.push_back(std::move(move));
    }

    ApplySummary summary = run_batch(moves, true);
    summary.append(unknown);
    record_applied(summary);
    return summary;
}


ApplySummary CameraSession::purge_redundant_copies()
{
    OperationGuard guard(busy);
    Inventory& inventory = current();

    const std::vector<RedundantCopy> copies = inventory.duplicates.redundant_copies;
    std::vector<PlannedMove> moves;
    moves.reserve(copies.size());
    for (const auto& copy : copies) {
        PlannedMove move;
        move.identity = copy.identity;
        move.source_path = copy.path;
        move.relative_target = copy.auto_folder.label();
        move.action = PlanAction::Trash;
        move.kind = classifier.kind_of(copy.identity);
        moves.push_back(std::move(move));
    }

    ApplySummary summary = run_batch(moves, false);
    for (std::size_t i = 0; i < summary.results.size() && i < copies.size(); ++i) {
        if (summary.results[i].outcome != ApplyOutcome::Succeeded) {
            continue;
        }
        for (auto& folder : inventory.folders) {
            if (folder.year == copies[i].auto_folder.year && folder.name == copies[i].auto_folder.name) {
                folder.members.erase(copies[i].identity);
            }
        }
    }
    refresh_annotations();
    return summary;
}


bool CameraSession::ignore(const std::string& identity)
{
    if (identity.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_EMPTY_FIELD, "identity");
    }
    if (!ignore_list_.add(identity)) {
        return false;
    }
    if (!ignore_list_.save()) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, ignore_list_.file_path());
    }
    refresh_annotations();
    return true;
}


bool CameraSession::unignore(const std::string& identity)
{
    if (!ignore_list_.remove(identity)) {
        return false;
    }
    if (!ignore_list_.save()) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, ignore_list_.file_path());
    }
    refresh_annotations();
    return true;
}


std::vector<ConflictRecord> CameraSession::conflicts(bool include_ignored) const
{
    return inventory().duplicates.reported_conflicts(include_ignored);
}


std::vector<OrganizedFolder> CameraSession::list_folders(int year) const
{
    return FolderCatalog(root()).list_folders(year);
}


OrganizedFolder CameraSession::create_folder(int year, const std::string& name)
{
    OrganizedFolder folder = FolderCatalog(root()).create_folder(year, name);
    if (inventory_ && !inventory_->find_folder(year, name)) {
        inventory_->folders.push_back(folder);
        sort_folders(inventory_->folders);
    }
    return folder;
}


std::vector<std::string> CameraSession::orphaned_edits() const
{
    std::vector<std::string> orphans;
    if (!inventory_) {
        return orphans;
    }
    for (const auto& identity : edits_.list_identities()) {
        if (!inventory_->find(identity)) {
            orphans.push_back(identity);
        }
    }
    return orphans;
}


std::size_t CameraSession::prune_frame_cache() const
{
    const Inventory& snapshot = inventory();
    std::vector<std::string> live_videos;
    for (const auto& entry : snapshot.pending) {
        if (entry.kind == MediaKind::Video) {
            live_videos.push_back(entry.source_path);
        }
    }
    for (const auto& folder : snapshot.folders) {
        for (const auto& member : folder.members) {
            if (classifier.kind_of(member) == MediaKind::Video) {
                live_videos.push_back(Utils::path_to_utf8(
                    Utils::utf8_to_path(folder.path) / Utils::utf8_to_path(member)));
            }
        }
    }
    return VideoFrameCache(root()).prune_orphans(live_videos);
}


std::vector<FileEntry*> CameraSession::require_entries(const std::vector<std::string>& identities)
{
    if (identities.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_EMPTY_FIELD, "identity");
    }
    Inventory& inventory = current();

    std::vector<FileEntry*> entries;
    for (const auto& identity : identities) {
        FileEntry* entry = inventory.find(identity);
        if (!entry) {
            THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_UNKNOWN_ENTRY, identity);
        }
        entries.push_back(entry);
    }
    return entries;
}


EditRecord CameraSession::edit_for(const FileEntry& entry) const
{
    return EditRecord{entry.year, entry.assigned_folder, entry.category};
}


void CameraSession::store_edit(const FileEntry& entry)
{
    edits_.set(entry.identity, edit_for(entry));
}


void CameraSession::save_edits() const
{
    if (!edits_.save()) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, edits_.file_path());
    }
}


void CameraSession::merge_edits(Inventory& inventory) const
{
    for (auto& entry : inventory.pending) {
        const auto edit = edits_.get(entry.identity);
        if (!edit) {
            continue;
        }
        if (edit->year) {
            entry.year = edit->year;
        }
        entry.assigned_folder = edit->folder;
        entry.category = edit->category;
    }
}


void CameraSession::refresh_annotations()
{
    if (!inventory_) {
        return;
    }
    inventory_->duplicates = DuplicateResolver().resolve(
        inventory_->pending, inventory_->folders, ignore_list_.identities());
}


BatchPlan CameraSession::plan_entries(const std::vector<const FileEntry*>& entries) const
{
    BatchPlan batch;
    PlacementPlanner planner(root(), {}, settings.get_max_collision_attempts());
    for (const auto* entry : entries) {
        PlanResult result = planner.plan(*entry);
        if (result.status == PlanStatus::Ready && result.move) {
            batch.moves.push_back(std::move(*result.move));
        } else {
            batch.blocked.push_back(BlockedEntry{entry->identity, result.status});
        }
    }
    return batch;
}


ApplySummary CameraSession::run_batch(const std::vector<PlannedMove>& moves, bool track_edits)
{
    VideoFrameCache frames(root());
    ApplyEngine engine(root(), trash, track_edits ? &edits_ : nullptr, &frames,
                       logger, settings.get_max_collision_attempts());
    return engine.apply(moves);
}


void CameraSession::record_applied(const ApplySummary& summary)
{
    Inventory& inventory = current();

    std::set<std::string> applied;
    for (const auto& result : summary.results) {
        if (result.outcome != ApplyOutcome::Succeeded) {
            continue;
        }
        applied.insert(result.identity);
        if (result.final_path.empty()) {
            continue;
        }

        // Keep folder membership current so later duplicate checks see the moved file
        const std::string relative = Utils::relative_display_path(result.final_path, inventory.root);
        const auto first = relative.find('/');
        const auto second = first == std::string::npos ? std::string::npos : relative.find('/', first + 1);
        if (second == std::string::npos || relative.find('/', second + 1) != std::string::npos) {
            continue;
        }
        const std::string year_name = relative.substr(0, first);
        const std::string folder_name = relative.substr(first + 1, second - first - 1);
        if (!PathRules::is_year_folder_name(year_name)
            || (PathRules::is_reserved_folder_name(folder_name)
                && !PathRules::is_auto_category_folder_name(folder_name))) {
            continue;
        }

        const int year = std::stoi(year_name);
        auto it = std::find_if(inventory.folders.begin(), inventory.folders.end(),
                               [year, &folder_name](const OrganizedFolder& folder) {
                                   return folder.year == year && folder.name == folder_name;
                               });
        if (it == inventory.folders.end()) {
            OrganizedFolder folder;
            folder.year = year;
            folder.name = folder_name;
            folder.path = Utils::path_to_utf8(Utils::utf8_to_path(result.final_path).parent_path());
            folder.color_tag = FolderCatalog::color_tag_for(folder_name);
            folder.auto_category = PathRules::is_auto_category_folder_name(folder_name);
            inventory.folders.push_back(std::move(folder));
            it = std::prev(inventory.folders.end());
        }
        it->members.insert(relative.substr(second + 1));
    }

    inventory.pending.erase(
        std::remove_if(inventory.pending.begin(), inventory.pending.end(),
                       [&applied](const FileEntry& entry) { return applied.contains(entry.identity); }),
        inventory.pending.end());
    sort_folders(inventory.folders);
    refresh_annotations();
}


ScanOptions CameraSession::scan_options() const
{
    ScanOptions options;
    options.include_other_files = settings.get_include_other_files();
    return options;
}
