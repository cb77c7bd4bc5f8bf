#include "backup/file_entry.hpp"
#include <stdexcept>

using json = nlohmann::json;

const char* entryTypeToString(EntryType type) {
    return type == EntryType::Directory ? "directory" : "file";
}

FileEntry entryFromJson(const json& item, const std::string& root) {
    if (!item.is_object()) {
        throw std::invalid_argument("listing item is not an object");
    }

    FileEntry entry;
    entry.root = root;
    try {
        entry.name = item.at("name").get<std::string>();
        entry.path = item.at("path").get<std::string>();

        std::string type = item.at("type").get<std::string>();
        if (type == "directory") {
            entry.type = EntryType::Directory;
        } else if (type == "file") {
            entry.type = EntryType::File;
        } else {
            throw std::invalid_argument("unknown entry type '" + type + "' for " + entry.path);
        }

        if (item.contains("size") && !item["size"].is_null()) {
            entry.size = item["size"].get<int64_t>();
        }
        if (item.contains("lastModified") && item["lastModified"].is_string()) {
            auto parsed = utils::parseIso8601(item["lastModified"].get<std::string>());
            if (parsed) {
                entry.lastModified = *parsed;
            }
        }
        if (item.contains("permissions") && item["permissions"].is_string()) {
            entry.permissions = item["permissions"].get<std::string>();
        }
        if (item.contains("md5") && item["md5"].is_string()) {
            entry.md5 = item["md5"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("malformed listing item: ") + e.what());
    }

    if (entry.isDirectory()) {
        entry.size.reset();
    }
    return entry;
}

json entryToJson(const FileEntry& entry) {
    json item;
    item["name"] = entry.name;
    item["path"] = entry.path;
    item["type"] = entryTypeToString(entry.type);
    item["size"] = entry.size ? json(*entry.size) : json(nullptr);
    item["lastModified"] = utils::formatIso8601(entry.lastModified);
    item["permissions"] = entry.permissions ? json(*entry.permissions) : json(nullptr);
    item["md5"] = entry.md5 ? json(*entry.md5) : json(nullptr);
    return item;
}
