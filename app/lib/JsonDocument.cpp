#include "JsonDocument.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace JsonDocument {

ReadResult read(const std::string& path)
{
    auto logger = Logger::get_logger("store_logger");
    ReadResult result;
    const fs::path file_path = Utils::utf8_to_path(path);

    std::error_code ec;
    if (!fs::exists(file_path, ec)) {
        result.status = ReadStatus::Missing;
        return result;
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        if (logger) {
            logger->error("Failed to open '{}' for reading", path);
        }
        result.status = ReadStatus::Unreadable;
        return result;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const std::string text = buffer.str();
    in.close();

    Json::CharReaderBuilder reader_builder;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    std::string errors;
    if (!reader->parse(text.c_str(), text.c_str() + text.size(), &result.value, &errors)) {
        if (logger) {
            logger->error("JSON parse error in '{}': {}", path, errors);
        }
        fs::rename(file_path, Utils::utf8_to_path(path + ".corrupt"), ec);
        if (ec && logger) {
            logger->warn("Could not preserve corrupt document '{}': {}", path, ec.message());
        }
        result.value = Json::Value();
        result.status = ReadStatus::Corrupt;
        return result;
    }

    result.status = ReadStatus::Ok;
    return result;
}


bool write_atomic(const std::string& path, const Json::Value& value)
{
    auto logger = Logger::get_logger("store_logger");
    const fs::path file_path = Utils::utf8_to_path(path);
    const fs::path temp_path = Utils::utf8_to_path(path + ".tmp");

    std::error_code ec;
    if (file_path.has_parent_path()) {
        fs::create_directories(file_path.parent_path(), ec);
        if (ec) {
            if (logger) {
                logger->error("Cannot create directory for '{}': {}", path, ec.message());
            }
            return false;
        }
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            if (logger) {
                logger->error("Failed to open '{}' for writing", Utils::path_to_utf8(temp_path));
            }
            return false;
        }
        out << Json::writeString(builder, value) << '\n';
        out.flush();
        if (!out) {
            if (logger) {
                logger->error("Failed to write '{}'", Utils::path_to_utf8(temp_path));
            }
            fs::remove(temp_path, ec);
            return false;
        }
    }

    fs::rename(temp_path, file_path, ec);
    if (ec) {
        if (logger) {
            logger->error("Failed to replace '{}': {}", path, ec.message());
        }
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return false;
    }
    return true;
}

} // namespace JsonDocument
