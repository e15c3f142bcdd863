#include "PathClassifier.hpp"
#include "Utils.hpp"

#include <cctype>
#include <filesystem>
#include <unordered_set>
#include <vector>

namespace {

struct DigitRun {
    std::size_t offset;
    std::string digits;
};

std::vector<DigitRun> digit_runs(const std::string& text)
{
    std::vector<DigitRun> runs;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        const std::size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        runs.push_back(DigitRun{start, text.substr(start, i - start)});
    }
    return runs;
}

bool is_leap_year(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool is_valid_date_token(const std::string& token)
{
    if (token.size() != 8) {
        return false;
    }
    const int year = std::stoi(token.substr(0, 4));
    const int month = std::stoi(token.substr(4, 2));
    const int day = std::stoi(token.substr(6, 2));
    if (!PathRules::is_valid_year(year) || month < 1 || month > 12 || day < 1) {
        return false;
    }
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int max_day = days_in_month[month - 1];
    if (month == 2 && is_leap_year(year)) {
        max_day = 29;
    }
    return day <= max_day;
}

bool is_valid_time_token(const std::string& token)
{
    if (token.size() != 6) {
        return false;
    }
    const int hour = std::stoi(token.substr(0, 2));
    const int minute = std::stoi(token.substr(2, 2));
    const int second = std::stoi(token.substr(4, 2));
    return hour < 24 && minute < 60 && second < 60;
}

std::string stem_of(const std::string& file_name)
{
    return Utils::path_to_utf8(Utils::utf8_to_path(file_name).stem());
}

} // namespace


Classification FilenamePathClassifier::classify(const std::string& file_name) const
{
    Classification result;
    result.year = extract_year(file_name);
    result.category = detect_category(file_name);
    result.capture_time = extract_capture_time(file_name);
    return result;
}


MediaKind FilenamePathClassifier::kind_of(const std::string& file_name) const
{
    static const std::unordered_set<std::string> image_extensions = {
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".heic", ".heif"
    };
    static const std::unordered_set<std::string> video_extensions = {
        ".mp4", ".avi", ".mov", ".wmv", ".flv", ".mkv", ".m4v", ".3gp", ".webm", ".mts"
    };

    const std::string ext = Utils::to_lower_ascii(
        Utils::path_to_utf8(Utils::utf8_to_path(file_name).extension()));
    if (image_extensions.contains(ext)) {
        return MediaKind::Image;
    }
    if (video_extensions.contains(ext)) {
        return MediaKind::Video;
    }
    return MediaKind::Other;
}


std::optional<int> FilenamePathClassifier::extract_year(const std::string& file_name)
{
    const auto runs = digit_runs(stem_of(file_name));

    // A full YYYYMMDD date is the strongest signal
    for (const auto& run : runs) {
        if (is_valid_date_token(run.digits)) {
            return std::stoi(run.digits.substr(0, 4));
        }
        // YYYYMMDDHHMMSS without separator
        if (run.digits.size() == 14 && is_valid_date_token(run.digits.substr(0, 8))
            && is_valid_time_token(run.digits.substr(8))) {
            return std::stoi(run.digits.substr(0, 4));
        }
    }

    // Date-shaped runs keep their year even when month or day is out of range
    for (const auto& run : runs) {
        if (run.digits.size() == 8 || run.digits.size() == 14) {
            const int year = std::stoi(run.digits.substr(0, 4));
            if (PathRules::is_valid_year(year)) {
                return year;
            }
        }
    }

    // Legacy names such as VID-2023-05-01 or Screenshot_2022-11-30-..., and longer
    // stamps that start with 20YY
    for (const auto& run : runs) {
        if (run.digits.size() >= 4 && run.digits.starts_with("20")) {
            return std::stoi(run.digits.substr(0, 4));
        }
    }
    return std::nullopt;
}


std::optional<std::string> FilenamePathClassifier::extract_capture_time(const std::string& file_name)
{
    const std::string stem = stem_of(file_name);
    const auto runs = digit_runs(stem);
    for (std::size_t i = 0; i + 1 < runs.size(); ++i) {
        const auto& date = runs[i];
        const auto& time = runs[i + 1];
        const std::size_t separator = date.offset + date.digits.size();
        if (is_valid_date_token(date.digits)
            && time.offset == separator + 1
            && stem[separator] == '_'
            && is_valid_time_token(time.digits)) {
            return date.digits + "_" + time.digits;
        }
    }
    return std::nullopt;
}


MediaCategory FilenamePathClassifier::detect_category(const std::string& file_name)
{
    const std::string lowered = Utils::to_lower_ascii(file_name);
    if (lowered.find("screenshot") != std::string::npos) {
        return MediaCategory::Screenshot;
    }
    if (lowered.find("screen") != std::string::npos
        && lowered.find("recorder") != std::string::npos) {
        return MediaCategory::ScreenRecording;
    }
    return MediaCategory::Normal;
}


namespace PathRules {

bool is_year_folder_name(const std::string& name)
{
    if (name.size() != 4) {
        return false;
    }
    for (char ch : name) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return is_valid_year(std::stoi(name));
}

bool is_reserved_folder_name(const std::string& name)
{
    return name.starts_with("!") || name.starts_with(".");
}

bool is_auto_category_folder_name(const std::string& name)
{
    return name.starts_with(kScreenshotsPrefix) || name.starts_with(kScreenRecorderPrefix);
}

bool is_valid_year(int year)
{
    return year >= kMinYear && year <= kMaxYear;
}

std::string auto_category_folder(MediaCategory category, int year)
{
    switch (category) {
        case MediaCategory::Screenshot:
            return std::string(kScreenshotsPrefix) + std::to_string(year);
        case MediaCategory::ScreenRecording:
            return std::string(kScreenRecorderPrefix) + std::to_string(year);
        case MediaCategory::Normal:
            break;
    }
    return {};
}

} // namespace PathRules
