#ifndef VIDEO_FRAME_CACHE_HPP
#define VIDEO_FRAME_CACHE_HPP

#include <array>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Preview frames extracted from videos, kept in <root>/!tempvideoscreen.
 *
 * Frames are named "<key>_<pct>.jpg" where key is derived from the video's source
 * path. The cache only tracks and purges frames; extraction is done elsewhere.
 */
class VideoFrameCache {
public:
    static constexpr std::array<int, 11> kPercentages{0, 10, 15, 25, 30, 50, 65, 75, 85, 95, 100};

    explicit VideoFrameCache(std::string root);

    // Eight lowercase hex digits of the 64-bit FNV-1a hash of `source_path`.
    static std::string cache_key(const std::string& source_path);
    static std::string frame_file_name(const std::string& key, int percentage);

    std::filesystem::path cache_dir() const;
    std::vector<std::filesystem::path> frame_paths(const std::string& source_path) const;

    // Removes the frames of one video; returns how many files were deleted.
    std::size_t purge(const std::string& source_path) const;

    // Removes frames whose key belongs to none of `live_videos`.
    std::size_t prune_orphans(const std::vector<std::string>& live_videos) const;

private:
    std::string root;
};

#endif
