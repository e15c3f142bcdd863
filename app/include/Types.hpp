#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>

enum class FileType {File, Directory};

inline std::string to_string(FileType type) {
    switch (type) {
        case FileType::File: return "File";
        case FileType::Directory: return "Directory";
        default: return "Unknown";
    }
}

/**
 * @brief Raw directory listing item produced by FileScanner.
 */
struct DirectoryItem {
    std::string full_path;
    std::string file_name;
    FileType type;
};

enum class MediaKind {Image, Video, Other};

enum class MediaCategory {Normal, Screenshot, ScreenRecording};

enum class EntryState {
    Unorganized,        ///< No year could be derived; the user must supply one.
    PendingAssignment,  ///< Year known, no destination folder yet.
    Planned,            ///< Year and folder known; a target path can be computed.
    Applied,
    Duplicate,          ///< Identity already stored in an organized folder.
    Ignored             ///< Duplicate whose identity is on the ignore list.
};

inline std::string to_string(MediaKind kind) {
    switch (kind) {
        case MediaKind::Image: return "image";
        case MediaKind::Video: return "video";
        case MediaKind::Other: return "other";
    }
    return "other";
}

inline std::string to_string(MediaCategory category) {
    switch (category) {
        case MediaCategory::Normal: return "normal";
        case MediaCategory::Screenshot: return "screenshot";
        case MediaCategory::ScreenRecording: return "screen-recording";
    }
    return "normal";
}

inline std::optional<MediaCategory> category_from_string(const std::string& value) {
    if (value == "normal") return MediaCategory::Normal;
    if (value == "screenshot") return MediaCategory::Screenshot;
    if (value == "screen-recording") return MediaCategory::ScreenRecording;
    return std::nullopt;
}

inline std::string to_string(EntryState state) {
    switch (state) {
        case EntryState::Unorganized: return "unorganized";
        case EntryState::PendingAssignment: return "pending-assignment";
        case EntryState::Planned: return "planned";
        case EntryState::Applied: return "applied";
        case EntryState::Duplicate: return "duplicate";
        case EntryState::Ignored: return "ignored";
    }
    return "unorganized";
}

/**
 * @brief One media file waiting in the camera folder root.
 */
struct FileEntry {
    std::string identity;           ///< File name, case-sensitive.
    std::string source_path;
    MediaKind kind{MediaKind::Other};
    std::optional<int> year;
    MediaCategory category{MediaCategory::Normal};
    std::string assigned_folder;
    EntryState state{EntryState::Unorganized};
    std::optional<std::string> capture_time;  ///< "YYYYMMDD_HHMMSS" when the name carries one.
    std::uintmax_t size_bytes{0};
    std::string duplicate_of;       ///< "YEAR/FOLDER" of the first organized copy.
    bool trash_eligible{false};
};

/**
 * @brief Derives the assignment state from year and folder, ignoring duplicate annotations.
 */
inline EntryState derive_state(const FileEntry& entry) {
    if (!entry.year) {
        return EntryState::Unorganized;
    }
    if (entry.assigned_folder.empty() && entry.category == MediaCategory::Normal) {
        return EntryState::PendingAssignment;
    }
    return EntryState::Planned;
}

/**
 * @brief A folder directly below a YEAR directory.
 */
struct OrganizedFolder {
    int year{0};
    std::string name;
    std::string path;
    std::string color_tag;
    bool auto_category{false};      ///< !Screenshots_YYYY or !ScreenRecorder_YYYY.
    std::set<std::string> members;

    std::string label() const { return std::to_string(year) + "/" + name; }
};

#endif
