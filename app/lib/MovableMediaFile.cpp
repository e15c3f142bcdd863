#include "MovableMediaFile.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"
#include <filesystem>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace {

#ifndef _WIN32
// Hard links fail with EEXIST instead of replacing, which gives a no-replace move
// on file systems without renameat2 support.
bool link_then_unlink(const std::filesystem::path& from,
                      const std::filesystem::path& to,
                      std::error_code& ec)
{
    if (::link(from.c_str(), to.c_str()) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (::unlink(from.c_str()) != 0) {
        ec = std::error_code(errno, std::generic_category());
        std::error_code cleanup;
        std::filesystem::remove(to, cleanup);
        return false;
    }
    return true;
}
#endif

// Like std::filesystem::rename, but reports file_exists instead of replacing the target.
void rename_no_replace(const std::filesystem::path& from,
                       const std::filesystem::path& to,
                       std::error_code& ec)
{
    ec.clear();
#ifdef _WIN32
    if (!MoveFileExW(from.c_str(), to.c_str(), 0)) {
        const DWORD error = GetLastError();
        if (error == ERROR_NOT_SAME_DEVICE) {
            ec = std::make_error_code(std::errc::cross_device_link);
        } else if (error == ERROR_ALREADY_EXISTS || error == ERROR_FILE_EXISTS) {
            ec = std::make_error_code(std::errc::file_exists);
        } else {
            ec = std::error_code(static_cast<int>(error), std::system_category());
        }
    }
#else
#if defined(__linux__) && defined(RENAME_NOREPLACE)
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return;
    }
    if (errno != EINVAL && errno != ENOSYS) {
        ec = std::error_code(errno, std::generic_category());
        return;
    }
#endif
    if (link_then_unlink(from, to, ec)) {
        return;
    }
    if (ec == std::errc::operation_not_permitted || ec == std::errc::not_supported) {
        // No hard links here (FAT, some network shares). The exists() check in
        // move_file() is all that guards the target on these file systems.
        ec.clear();
        std::filesystem::rename(from, to, ec);
    }
#endif
}

} // namespace


MovableMediaFile::MovableMediaFile(const std::string& source_path,
                                   const std::string& destination_path)
    : source_path(Utils::utf8_to_path(source_path)),
      destination_path(Utils::utf8_to_path(destination_path))
{
    if (source_path.empty() || destination_path.empty()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Invalid path while constructing MovableMediaFile (source='{}', destination='{}')",
                          source_path, destination_path);
        }
        THROW_APP_ERROR(ErrorCodes::Code::PATH_INVALID, source_path + " -> " + destination_path);
    }
}


void MovableMediaFile::create_destination_dirs() const
{
    const std::filesystem::path parent = destination_path.parent_path();
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec || !std::filesystem::is_directory(parent)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to create directories for '{}': {}",
                          get_file_name(), ec ? ec.message() : "not a directory");
        }
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_CREATE_FAILED, Utils::path_to_utf8(parent));
    }
}


bool MovableMediaFile::move_file(std::error_code& ec) const
{
    ec.clear();
    auto logger = Logger::get_logger("core_logger");

    if (!std::filesystem::exists(source_path)) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        if (logger) {
            logger->warn("Source file missing when moving '{}': {}", get_file_name(), get_source_path());
        }
        return false;
    }

    if (std::filesystem::exists(destination_path)) {
        ec = std::make_error_code(std::errc::file_exists);
        if (logger) {
            logger->info("Destination already contains '{}'; skipping move", get_destination_path());
        }
        return false;
    }

    if (auto simulated = TestHooks::run_move_hook(
            TestHooks::MoveHookInfo{get_source_path(), get_destination_path()})) {
        ec = *simulated;
        if (logger) {
            logger->warn("Move of '{}' rejected: {}", get_source_path(), ec.message());
        }
        return false;
    }

    rename_no_replace(source_path, destination_path, ec);
    if (ec == std::errc::cross_device_link) {
        ec.clear();
        if (!copy_then_remove(ec)) {
            if (logger) {
                logger->error("Failed to move '{}' across devices to '{}': {}",
                              get_source_path(), get_destination_path(), ec.message());
            }
            return false;
        }
    } else if (ec) {
        if (logger) {
            logger->error("Failed to move '{}' to '{}': {}",
                          get_source_path(), get_destination_path(), ec.message());
        }
        return false;
    }

    if (logger) {
        logger->info("Moved '{}' to '{}'", get_source_path(), get_destination_path());
    }
    return true;
}


bool MovableMediaFile::copy_then_remove(std::error_code& ec) const
{
    if (!std::filesystem::copy_file(source_path, destination_path,
                                    std::filesystem::copy_options::none, ec)) {
        return false;
    }
    std::filesystem::remove(source_path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(destination_path, cleanup);
        return false;
    }
    return true;
}


std::string MovableMediaFile::get_source_path() const
{
    return Utils::path_to_utf8(source_path);
}


std::string MovableMediaFile::get_destination_path() const
{
    return Utils::path_to_utf8(destination_path);
}


std::string MovableMediaFile::get_file_name() const
{
    return Utils::path_to_utf8(source_path.filename());
}
