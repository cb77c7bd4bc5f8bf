#include "backup/http_directory_provider.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <stdexcept>

HttpDirectoryProvider::HttpDirectoryProvider(const std::string& address, const std::string& token,
                                             const AgentClientOptions& options)
    : client_(std::make_unique<AgentRestClient>(address, token, options)) {
}

HttpDirectoryProvider::HttpDirectoryProvider(std::unique_ptr<AgentRestClient> client)
    : client_(std::move(client)) {
}

FileEntryList HttpDirectoryProvider::parseListing(const nlohmann::json& listing, const std::string& root) {
    if (!listing.is_array()) {
        throw TransportError("Listing response is not a JSON array");
    }

    FileEntryList entries;
    entries.reserve(listing.size());
    for (const auto& item : listing) {
        try {
            entries.push_back(entryFromJson(item, root));
        } catch (const std::invalid_argument& e) {
            throw TransportError(std::string("Malformed listing from agent: ") + e.what());
        }
    }
    return entries;
}

FileEntryList HttpDirectoryProvider::listEntries(const std::string& root) {
    auto entries = parseListing(client_->listDirectory(root), root);
    Logger::info("Agent " + client_->baseUrl() + " listed " + std::to_string(entries.size()) +
                 " entries under " + root);
    return entries;
}

void HttpDirectoryProvider::fetchFile(const FileEntry& entry, const std::string& targetPath) {
    client_->downloadFile(entry.path, targetPath);
}

std::string HttpDirectoryProvider::describe() const {
    return "agent " + client_->baseUrl();
}
