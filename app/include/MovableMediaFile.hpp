#ifndef MOVABLEMEDIAFILE_HPP
#define MOVABLEMEDIAFILE_HPP

#include <filesystem>
#include <string>
#include <system_error>


class MovableMediaFile {
public:
    MovableMediaFile(const std::string& source_path, const std::string& destination_path);

    // Creates the destination's parent directories; a no-op when they already exist.
    // Throws ErrorCodes::AppException(DIRECTORY_CREATE_FAILED).
    void create_destination_dirs() const;

    // Never replaces an existing destination. Falls back to copy + remove across devices.
    bool move_file(std::error_code& ec) const;

    std::string get_source_path() const;
    std::string get_destination_path() const;
    std::string get_file_name() const;

private:
    bool copy_then_remove(std::error_code& ec) const;

    std::filesystem::path source_path;
    std::filesystem::path destination_path;
};

#endif
