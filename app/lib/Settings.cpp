#include "Settings.hpp"
#include "JsonDocument.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <cstdio>
#include <cstdlib>
#include <utility>
#include <QStandardPaths>
#include <QString>
#include <QByteArray>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#ifdef _WIN32
    #include <shlobj.h>
    #include <windows.h>
#endif


namespace {
template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("store_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

constexpr const char* kAppName = "CameraSorter";
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }

    auto to_utf8 = [](const QString& value) -> std::string {
        const QByteArray bytes = value.toUtf8();
        return std::string(bytes.constData(), static_cast<std::size_t>(bytes.size()));
    };

    QString pictures = QStandardPaths::writableLocation(QStandardPaths::PicturesLocation);
    if (!pictures.isEmpty()) {
        default_camera_path = to_utf8(pictures);
    } else {
        QString home = QStandardPaths::writableLocation(QStandardPaths::HomeLocation);
        if (!home.isEmpty()) {
            default_camera_path = to_utf8(home);
        }
    }

    if (default_camera_path.empty()) {
        default_camera_path = Utils::path_to_utf8(std::filesystem::current_path());
    }

    camera_path = default_camera_path;
}


std::string Settings::define_config_path()
{
    if (const char* override_root = std::getenv("CAMERA_SORTER_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / kAppName / "config.json").string();
    }
#ifdef _WIN32
    char appDataPath[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, 0, appDataPath))) {
        return std::string(appDataPath) + "\\" + kAppName + "\\config.json";
    }
#elif defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/Library/Application Support/" + kAppName + "/config.json";
    }
#else
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/" + kAppName + "/config.json";
    }
#endif
    return "config.json";
}


std::string Settings::get_config_dir() const
{
    return Utils::path_to_utf8(config_dir);
}


std::string Settings::get_log_dir() const
{
    return Utils::path_to_utf8(config_dir / "logs");
}


bool Settings::load()
{
    const auto document = JsonDocument::read(config_path);
    if (document.status == JsonDocument::ReadStatus::Missing) {
        settings_log(spdlog::level::info, "No configuration at '{}', writing defaults", config_path);
        camera_path = default_camera_path;
        save();
        return false;
    }
    if (document.status != JsonDocument::ReadStatus::Ok || !document.value.isObject()) {
        settings_log(spdlog::level::err, "Configuration '{}' is unusable, using defaults", config_path);
        camera_path = default_camera_path;
        return false;
    }

    const Json::Value& root = document.value;
    camera_path = root.get("camera_path", default_camera_path).asString();
    if (camera_path.empty()) {
        camera_path = default_camera_path;
    }
    include_other_files = root.get("include_other_files", false).asBool();
    log_level = root.get("log_level", "info").asString();

    const Json::Value attempts = root.get("max_collision_attempts", 9999);
    max_collision_attempts = attempts.isInt() && attempts.asInt() > 0 ? attempts.asInt() : 9999;
    return true;
}


bool Settings::save()
{
    Json::Value root(Json::objectValue);
    root["camera_path"] = camera_path;
    root["include_other_files"] = include_other_files;
    root["max_collision_attempts"] = max_collision_attempts;
    root["log_level"] = log_level;

    if (!JsonDocument::write_atomic(config_path, root)) {
        settings_log(spdlog::level::err, "Failed to save configuration to '{}'", config_path);
        return false;
    }
    return true;
}


std::string Settings::get_camera_path() const
{
    return camera_path;
}


void Settings::set_camera_path(const std::string &path)
{
    camera_path = path;
}


bool Settings::get_include_other_files() const
{
    return include_other_files;
}


void Settings::set_include_other_files(bool value)
{
    include_other_files = value;
}


int Settings::get_max_collision_attempts() const
{
    return max_collision_attempts;
}


void Settings::set_max_collision_attempts(int value)
{
    max_collision_attempts = value > 0 ? value : 9999;
}


std::string Settings::get_log_level() const
{
    return log_level;
}


void Settings::set_log_level(const std::string& value)
{
    log_level = value;
}
