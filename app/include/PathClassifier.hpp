#ifndef PATH_CLASSIFIER_HPP
#define PATH_CLASSIFIER_HPP

#include "Types.hpp"

#include <optional>
#include <string>

struct Classification {
    std::optional<int> year;
    MediaCategory category{MediaCategory::Normal};
    std::optional<std::string> capture_time;
};

/**
 * @brief Derives semantic information from a file name without touching the disk.
 *
 * Scan and duplicate logic only see this interface, so the matching rules can be
 * swapped (e.g. for a different camera naming scheme) without changing them.
 */
class IPathClassifier {
public:
    virtual ~IPathClassifier() = default;

    virtual Classification classify(const std::string& file_name) const = 0;
    virtual MediaKind kind_of(const std::string& file_name) const = 0;
};

/**
 * @brief Default rules for phone camera uploads (IMG_20240315_123045.jpg,
 *        Screenshot_2024-03-15-..., Screenrecorder-2024-...mp4).
 */
class FilenamePathClassifier : public IPathClassifier {
public:
    Classification classify(const std::string& file_name) const override;
    MediaKind kind_of(const std::string& file_name) const override;

    static std::optional<int> extract_year(const std::string& file_name);
    static std::optional<std::string> extract_capture_time(const std::string& file_name);
    static MediaCategory detect_category(const std::string& file_name);
};

namespace PathRules {

inline constexpr const char* kDuplicateFolder = "!duplicate";
inline constexpr const char* kFrameCacheFolder = "!tempvideoscreen";
inline constexpr const char* kScreenshotsPrefix = "!Screenshots_";
inline constexpr const char* kScreenRecorderPrefix = "!ScreenRecorder_";
inline constexpr int kMinYear = 1900;
inline constexpr int kMaxYear = 2099;

bool is_year_folder_name(const std::string& name);
bool is_reserved_folder_name(const std::string& name);
bool is_auto_category_folder_name(const std::string& name);
bool is_valid_year(int year);

// "!Screenshots_2024" / "!ScreenRecorder_2024"; empty for MediaCategory::Normal.
std::string auto_category_folder(MediaCategory category, int year);

} // namespace PathRules

#endif
