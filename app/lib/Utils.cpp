#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>


std::filesystem::path Utils::utf8_to_path(const std::string& value)
{
#ifdef _WIN32
    std::u8string utf8(value.begin(), value.end());
    return std::filesystem::path(utf8);
#else
    return std::filesystem::path(value);
#endif
}


std::string Utils::path_to_utf8(const std::filesystem::path& path)
{
#ifdef _WIN32
    const std::u8string utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
#else
    return path.string();
#endif
}


std::string Utils::to_lower_ascii(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}


std::string Utils::relative_display_path(const std::string& path, const std::string& root)
{
    std::error_code ec;
    const auto relative = std::filesystem::relative(utf8_to_path(path), utf8_to_path(root), ec);
    if (ec || relative.empty()) {
        return path;
    }
    const std::u8string generic = relative.generic_u8string();
    const std::string text(generic.begin(), generic.end());
    if (text.starts_with("..")) {
        return path;
    }
    return text;
}


bool Utils::is_valid_directory(const std::string& path)
{
    std::error_code ec;
    return !path.empty() && std::filesystem::is_directory(utf8_to_path(path), ec);
}
