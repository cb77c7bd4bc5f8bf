#include "backup/local_directory.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>
#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace {

const char* const kStagingMarker = ".syncwarden-";
const char* const kStagingSuffix = ".tmp";

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

utils::TimePoint toSystemTime(fs::file_time_type fileTime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        fileTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

FileEntry makeEntry(const fs::directory_entry& item, const std::string& root, EntryType type) {
    FileEntry entry;
    entry.name = item.path().filename().string();
    entry.path = item.path().string();
    entry.root = root;
    entry.type = type;

    std::error_code ec;
    auto mtime = item.last_write_time(ec);
    if (!ec) {
        entry.lastModified = toSystemTime(mtime);
    }
    if (type == EntryType::File) {
        auto size = item.file_size(ec);
        if (!ec) {
            entry.size = static_cast<int64_t>(size);
        }
    }
    auto permissions = LocalDirectory::permissionsOf(entry.path);
    if (!permissions.empty()) {
        entry.permissions = permissions;
    }
    return entry;
}

void walk(const fs::path& directory, const std::string& root, bool computeChecksums,
          FileEntryList& entries, std::vector<std::string>* skippedLinks) {
    std::vector<fs::directory_entry> subdirectories;
    std::vector<fs::directory_entry> files;

    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::warning("Cannot read directory " + directory.string() + ": " + ec.message());
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::warning("Error iterating " + directory.string() + ": " + ec.message());
            break;
        }
        std::error_code typeEc;
        if (it->is_symlink(typeEc)) {
            // Links are not followed; the destination only ever holds regular files.
            Logger::debug("Skipping symlink " + it->path().string());
            if (skippedLinks) {
                skippedLinks->push_back(it->path().string());
            }
            continue;
        }
        if (LocalDirectory::isStagingName(it->path().filename().string())) {
            continue;
        }
        if (it->is_directory(typeEc)) {
            subdirectories.push_back(*it);
        } else if (it->is_regular_file(typeEc)) {
            files.push_back(*it);
        }
    }

    auto byName = [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename().string() < b.path().filename().string();
    };
    std::sort(subdirectories.begin(), subdirectories.end(), byName);
    std::sort(files.begin(), files.end(), byName);

    for (const auto& subdirectory : subdirectories) {
        entries.push_back(makeEntry(subdirectory, root, EntryType::Directory));
        walk(subdirectory.path(), root, computeChecksums, entries, skippedLinks);
    }
    for (const auto& file : files) {
        FileEntry entry = makeEntry(file, root, EntryType::File);
        if (computeChecksums) {
            auto md5 = LocalDirectory::md5OfFile(entry.path);
            if (!md5.empty()) {
                entry.md5 = md5;
            }
        }
        entries.push_back(std::move(entry));
    }
}

} // namespace

FileEntryList LocalDirectory::listEntries(const std::string& root, bool computeChecksums,
                                         bool createIfMissing,
                                         std::vector<std::string>* skippedLinks) {
    if (root.empty()) {
        throw DestinationError("Destination path is empty");
    }
    for (const auto& part : fs::path(root)) {
        if (part == "..") {
            throw DestinationError("Invalid destination path: directory traversal (..) is not allowed: " + root);
        }
    }

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        if (!createIfMissing) {
            Logger::info("Destination directory does not exist yet: " + root);
            return {};
        }
        Logger::info("Destination directory does not exist, creating: " + root);
        if (!fs::create_directories(root, ec) && ec) {
            throw DestinationError("Cannot create destination " + root + ": " + ec.message());
        }
    } else if (!fs::is_directory(root, ec)) {
        throw DestinationError("Destination is not a directory: " + root);
    }

    fs::directory_iterator readable(root, ec);
    if (ec) {
        throw DestinationError("Access denied to destination directory " + root + ": " + ec.message());
    }

    FileEntryList entries;
    walk(fs::path(root), root, computeChecksums, entries, skippedLinks);
    return entries;
}

std::string LocalDirectory::stagingPathFor(const std::string& targetPath) {
    fs::path target(targetPath);
    std::string name = "." + target.filename().string() + kStagingMarker + utils::generateId() +
                       kStagingSuffix;
    return (target.parent_path() / name).string();
}

bool LocalDirectory::isStagingName(const std::string& fileName) {
    static const std::string suffix = kStagingSuffix;
    return fileName.size() > suffix.size() && fileName[0] == '.' &&
           fileName.find(kStagingMarker) != std::string::npos &&
           fileName.compare(fileName.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string LocalDirectory::md5OfFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Logger::warning("Cannot open " + path + " for checksum");
        return "";
    }

    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return "";
    }

    char buffer[64 * 1024];
    while (file) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            return "";
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
        return "";
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string LocalDirectory::permissionsOf(const std::string& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec) {
        return "";
    }
    auto perms = static_cast<unsigned>(status.permissions()) & 0777u;
    std::stringstream ss;
    ss << std::oct << std::setw(3) << std::setfill('0') << perms;
    return ss.str();
}
