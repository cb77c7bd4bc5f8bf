#pragma once

#include "common/utils.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class EntryType {
    File,
    Directory
};

// One file or directory as reported by a directory listing.
struct FileEntry {
    std::string name;                    // file name with extension
    std::string path;                    // full path on the host that listed it
    std::string root;                    // listing root the entry was found under
    EntryType type = EntryType::File;
    std::optional<int64_t> size;         // unset for directories
    utils::TimePoint lastModified{};
    std::optional<std::string> permissions;
    std::optional<std::string> md5;      // informational only

    bool isFile() const { return type == EntryType::File; }
    bool isDirectory() const { return type == EntryType::Directory; }
};

using FileEntryList = std::vector<FileEntry>;

const char* entryTypeToString(EntryType type);

// Agent wire format: {name, path, type, size, lastModified, permissions, md5}.
// Throws std::invalid_argument on a missing or mistyped field.
FileEntry entryFromJson(const nlohmann::json& item, const std::string& root);
nlohmann::json entryToJson(const FileEntry& entry);
