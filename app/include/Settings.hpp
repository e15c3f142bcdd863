#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <filesystem>
#include <string>


class Settings
{
public:
    Settings();

    // Returns false when config.json was missing or unreadable; defaults are used then.
    bool load();
    bool save();

    std::string get_camera_path() const;
    void set_camera_path(const std::string &path);

    bool get_include_other_files() const;
    void set_include_other_files(bool value);

    int get_max_collision_attempts() const;
    void set_max_collision_attempts(int value);

    std::string get_log_level() const;
    void set_log_level(const std::string& value);

    std::string define_config_path();
    std::string get_config_dir() const;
    std::string get_log_dir() const;

private:
    std::string config_path;
    std::filesystem::path config_dir;

    std::string default_camera_path;
    std::string camera_path;
    bool include_other_files{false};
    int max_collision_attempts{9999};
    std::string log_level{"info"};
};

#endif
