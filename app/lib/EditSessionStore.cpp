#include "EditSessionStore.hpp"
#include "JsonDocument.hpp"
#include "Logger.hpp"

#include <utility>

namespace {

std::optional<EditRecord> parse_record(const Json::Value& value)
{
    EditRecord record;
    // Older documents stored only the folder name
    if (value.isString()) {
        record.folder = value.asString();
        return record;
    }
    if (!value.isObject()) {
        return std::nullopt;
    }
    if (value.isMember("year") && value["year"].isInt()) {
        record.year = value["year"].asInt();
    } else if (value.isMember("year") && value["year"].isString()) {
        try {
            record.year = std::stoi(value["year"].asString());
        } catch (const std::exception&) {
            record.year.reset();
        }
    }
    if (value.isMember("folder") && value["folder"].isString()) {
        record.folder = value["folder"].asString();
    }
    if (value.isMember("category") && value["category"].isString()) {
        if (auto category = category_from_string(value["category"].asString())) {
            record.category = *category;
        }
    }
    return record;
}

Json::Value to_json(const EditRecord& record)
{
    Json::Value value(Json::objectValue);
    value["year"] = record.year ? Json::Value(*record.year) : Json::Value(Json::nullValue);
    value["folder"] = record.folder;
    value["category"] = to_string(record.category);
    return value;
}

} // namespace

EditSessionStore::EditSessionStore(std::string config_dir)
    : file_path_(std::move(config_dir) + "/edits.json") {}

bool EditSessionStore::load()
{
    auto logger = Logger::get_logger("store_logger");
    entries_.clear();

    const auto document = JsonDocument::read(file_path_);
    if (document.status == JsonDocument::ReadStatus::Missing) {
        return true;
    }
    if (document.status != JsonDocument::ReadStatus::Ok) {
        return false;
    }
    if (!document.value.isObject()) {
        if (logger) {
            logger->error("Edit session '{}' is not a JSON object; starting empty", file_path_);
        }
        return false;
    }

    for (const auto& identity : document.value.getMemberNames()) {
        if (auto record = parse_record(document.value[identity])) {
            entries_[identity] = std::move(*record);
        } else if (logger) {
            logger->warn("Dropping malformed edit for '{}'", identity);
        }
    }
    if (logger) {
        logger->info("Loaded {} pending edit(s) from '{}'", entries_.size(), file_path_);
    }
    return true;
}

bool EditSessionStore::save() const
{
    Json::Value root(Json::objectValue);
    for (const auto& [identity, record] : entries_) {
        root[identity] = to_json(record);
    }
    const bool ok = JsonDocument::write_atomic(file_path_, root);
    if (auto logger = Logger::get_logger("store_logger")) {
        if (ok) {
            logger->debug("Saved {} pending edit(s)", entries_.size());
        } else {
            logger->error("Failed to save edit session to '{}'", file_path_);
        }
    }
    return ok;
}

std::optional<EditRecord> EditSessionStore::get(const std::string& identity) const
{
    if (auto it = entries_.find(identity); it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void EditSessionStore::set(const std::string& identity, EditRecord record)
{
    entries_[identity] = std::move(record);
}

bool EditSessionStore::remove(const std::string& identity)
{
    return entries_.erase(identity) > 0;
}

bool EditSessionStore::contains(const std::string& identity) const
{
    return entries_.contains(identity);
}

std::vector<std::string> EditSessionStore::list_identities() const
{
    std::vector<std::string> identities;
    identities.reserve(entries_.size());
    for (const auto& entry : entries_) {
        identities.push_back(entry.first);
    }
    return identities;
}
