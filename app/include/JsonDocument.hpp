#ifndef JSON_DOCUMENT_HPP
#define JSON_DOCUMENT_HPP

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <string>

/**
 * @brief Small load/save helpers shared by the JSON backed stores.
 */
namespace JsonDocument {

enum class ReadStatus {Ok, Missing, Corrupt, Unreadable};

struct ReadResult {
    ReadStatus status{ReadStatus::Missing};
    Json::Value value;
};

// Corrupt documents are renamed to "<path>.corrupt" so the next save cannot destroy them.
ReadResult read(const std::string& path);

// Writes "<path>.tmp" and renames it over `path`. Returns false on any I/O error.
bool write_atomic(const std::string& path, const Json::Value& value);

} // namespace JsonDocument

#endif
