#include "VideoFrameCache.hpp"
#include "Logger.hpp"
#include "PathClassifier.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kKeyLength = 8;

// "<8 hex>_<3 digits>.jpg"
bool parse_frame_key(const std::string& file_name, std::string& key)
{
    constexpr std::size_t expected_length = kKeyLength + 1 + 3 + 4;
    if (file_name.size() != expected_length || file_name[kKeyLength] != '_') {
        return false;
    }
    if (file_name.compare(kKeyLength + 4, 4, ".jpg") != 0) {
        return false;
    }
    for (std::size_t i = 0; i < kKeyLength; ++i) {
        const char c = file_name[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    for (std::size_t i = kKeyLength + 1; i < kKeyLength + 4; ++i) {
        if (file_name[i] < '0' || file_name[i] > '9') {
            return false;
        }
    }
    key = file_name.substr(0, kKeyLength);
    return true;
}

} // namespace


VideoFrameCache::VideoFrameCache(std::string root)
    : root(std::move(root)) {}


std::string VideoFrameCache::cache_key(const std::string& source_path)
{
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : source_path) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return fmt::format("{:08x}", static_cast<std::uint32_t>(hash & 0xffffffffULL));
}


std::string VideoFrameCache::frame_file_name(const std::string& key, int percentage)
{
    return fmt::format("{}_{:03d}.jpg", key, percentage);
}


fs::path VideoFrameCache::cache_dir() const
{
    return Utils::utf8_to_path(root) / PathRules::kFrameCacheFolder;
}


std::vector<fs::path> VideoFrameCache::frame_paths(const std::string& source_path) const
{
    const std::string key = cache_key(source_path);
    const fs::path dir = cache_dir();

    std::vector<fs::path> paths;
    paths.reserve(kPercentages.size());
    for (int percentage : kPercentages) {
        paths.push_back(dir / frame_file_name(key, percentage));
    }
    return paths;
}


std::size_t VideoFrameCache::purge(const std::string& source_path) const
{
    std::size_t removed = 0;
    for (const auto& frame : frame_paths(source_path)) {
        std::error_code ec;
        if (fs::remove(frame, ec)) {
            ++removed;
        } else if (ec) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->warn("Could not remove cached frame '{}': {}",
                             Utils::path_to_utf8(frame), ec.message());
            }
        }
    }
    if (removed > 0) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Purged {} cached frame(s) of '{}'", removed, source_path);
        }
    }
    return removed;
}


std::size_t VideoFrameCache::prune_orphans(const std::vector<std::string>& live_videos) const
{
    const fs::path dir = cache_dir();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return 0;
    }

    std::set<std::string> live_keys;
    for (const auto& video : live_videos) {
        live_keys.insert(cache_key(video));
    }

    std::vector<fs::path> orphans;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Cannot read frame cache '{}': {}", Utils::path_to_utf8(dir), ec.message());
        }
        return 0;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::string key;
        const std::string name = Utils::path_to_utf8(it->path().filename());
        if (parse_frame_key(name, key) && !live_keys.contains(key)) {
            orphans.push_back(it->path());
        }
    }

    std::size_t removed = 0;
    for (const auto& orphan : orphans) {
        std::error_code remove_ec;
        if (fs::remove(orphan, remove_ec)) {
            ++removed;
        }
    }
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Pruned {} orphaned frame(s) from '{}'", removed, Utils::path_to_utf8(dir));
    }
    return removed;
}
