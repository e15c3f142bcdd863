#include "FolderCatalog.hpp"
#include "AppException.hpp"
#include "FileScanner.hpp"
#include "Logger.hpp"
#include "PathClassifier.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::uint64_t fnv1a(const std::string& text)
{
    std::uint64_t hash = 14695981039346656037ull;
    for (unsigned char ch : text) {
        hash ^= ch;
        hash *= 1099511628211ull;
    }
    return hash;
}

struct Rgb {
    int r;
    int g;
    int b;
};

Rgb hsl_to_rgb(double hue, double saturation, double lightness)
{
    const double c = (1.0 - std::fabs(2.0 * lightness - 1.0)) * saturation;
    const double x = c * (1.0 - std::fabs(std::fmod(hue / 60.0, 2.0) - 1.0));
    const double m = lightness - c / 2.0;

    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    if (hue < 60) {
        r = c; g = x;
    } else if (hue < 120) {
        r = x; g = c;
    } else if (hue < 180) {
        g = c; b = x;
    } else if (hue < 240) {
        g = x; b = c;
    } else if (hue < 300) {
        r = x; b = c;
    } else {
        r = c; b = x;
    }
    return Rgb{static_cast<int>((r + m) * 255),
               static_cast<int>((g + m) * 255),
               static_cast<int>((b + m) * 255)};
}

} // namespace


FolderCatalog::FolderCatalog(std::string root)
    : root(std::move(root))
{
}


std::vector<OrganizedFolder> FolderCatalog::list_folders(int year) const
{
    std::vector<OrganizedFolder> folders;
    const fs::path year_path = Utils::utf8_to_path(root) / std::to_string(year);
    std::error_code ec;
    if (!fs::is_directory(year_path, ec)) {
        return folders;
    }

    FileScanner scanner;
    try {
        for (const auto& item : scanner.get_directory_entries(Utils::path_to_utf8(year_path),
                                                              FileScanOptions::Directories)) {
            if (PathRules::is_reserved_folder_name(item.file_name)) {
                continue;
            }
            OrganizedFolder folder;
            folder.year = year;
            folder.name = item.file_name;
            folder.path = item.full_path;
            folder.color_tag = color_tag_for(item.file_name);
            folders.push_back(std::move(folder));
        }
    } catch (const fs::filesystem_error& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Cannot list folders of {}: {}", year, ex.what());
        }
    }
    return folders;
}


OrganizedFolder FolderCatalog::create_folder(int year, const std::string& name) const
{
    if (!PathRules::is_valid_year(year)) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE, std::to_string(year));
    }
    if (!is_valid_folder_name(name)) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_FOLDER_NAME, name);
    }

    const fs::path folder_path = Utils::utf8_to_path(root) / std::to_string(year) / Utils::utf8_to_path(name);
    std::error_code ec;
    const bool created = fs::create_directories(folder_path, ec);
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to create folder '{}': {}", Utils::path_to_utf8(folder_path), ec.message());
        }
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_CREATE_FAILED, Utils::path_to_utf8(folder_path));
    }
    if (auto logger = Logger::get_logger("core_logger")) {
        if (created) {
            logger->info("Created folder '{}'", Utils::path_to_utf8(folder_path));
        } else {
            logger->debug("Folder '{}' already exists", Utils::path_to_utf8(folder_path));
        }
    }

    OrganizedFolder folder;
    folder.year = year;
    folder.name = name;
    folder.path = Utils::path_to_utf8(folder_path);
    folder.color_tag = color_tag_for(name);
    return folder;
}


std::string FolderCatalog::color_tag_for(const std::string& name)
{
    if (name.empty()) {
        return {};
    }
    const double hue = static_cast<double>(fnv1a(name) % 360);
    const Rgb rgb = hsl_to_rgb(hue, 0.4, 0.9);
    return fmt::format("#{:02x}{:02x}{:02x}", rgb.r, rgb.g, rgb.b);
}


bool FolderCatalog::is_valid_folder_name(const std::string& name)
{
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    if (name.starts_with("!") || name.front() == ' ' || name.back() == ' ') {
        return false;
    }
    static const std::string forbidden = "/\\:*?\"<>|";
    return std::none_of(name.begin(), name.end(), [](char ch) {
        return forbidden.find(ch) != std::string::npos || static_cast<unsigned char>(ch) < 0x20;
    });
}
