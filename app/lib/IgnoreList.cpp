#include "IgnoreList.hpp"
#include "JsonDocument.hpp"
#include "Logger.hpp"

#include <utility>

IgnoreList::IgnoreList(std::string config_dir)
    : file_path_(std::move(config_dir) + "/ignore.json") {}

bool IgnoreList::load()
{
    auto logger = Logger::get_logger("store_logger");
    identities_.clear();

    const auto document = JsonDocument::read(file_path_);
    if (document.status == JsonDocument::ReadStatus::Missing) {
        return true;
    }
    if (document.status != JsonDocument::ReadStatus::Ok) {
        return false;
    }
    if (!document.value.isArray()) {
        if (logger) {
            logger->error("Ignore list '{}' is not a JSON array; starting empty", file_path_);
        }
        return false;
    }

    for (const auto& item : document.value) {
        if (item.isString() && !item.asString().empty()) {
            identities_.insert(item.asString());
        }
    }
    if (logger) {
        logger->info("Loaded {} ignored identity(ies)", identities_.size());
    }
    return true;
}

bool IgnoreList::save() const
{
    Json::Value root(Json::arrayValue);
    for (const auto& identity : identities_) {
        root.append(identity);
    }
    const bool ok = JsonDocument::write_atomic(file_path_, root);
    if (!ok) {
        if (auto logger = Logger::get_logger("store_logger")) {
            logger->error("Failed to save ignore list to '{}'", file_path_);
        }
    }
    return ok;
}

bool IgnoreList::add(const std::string& identity)
{
    if (identity.empty()) {
        return false;
    }
    return identities_.insert(identity).second;
}

bool IgnoreList::remove(const std::string& identity)
{
    return identities_.erase(identity) > 0;
}
