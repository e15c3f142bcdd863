#ifndef UTILS_HPP
#define UTILS_HPP

#include <filesystem>
#include <string>

class Utils {
public:
    static std::filesystem::path utf8_to_path(const std::string& value);
    static std::string path_to_utf8(const std::filesystem::path& path);
    static std::string to_lower_ascii(std::string value);

    // Path of `path` relative to `root` with forward slashes; the input when it lies outside root.
    static std::string relative_display_path(const std::string& path, const std::string& root);

    static bool is_valid_directory(const std::string& path);
};

#endif
