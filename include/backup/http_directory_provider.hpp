#pragma once

#include "backup/directory_provider.hpp"
#include "common/agent_rest_client.hpp"
#include <memory>

// Source tree served by the agent companion process (/Look and /Download).
class HttpDirectoryProvider : public DirectoryProvider {
public:
    HttpDirectoryProvider(const std::string& address, const std::string& token,
                          const AgentClientOptions& options);
    explicit HttpDirectoryProvider(std::unique_ptr<AgentRestClient> client);
    ~HttpDirectoryProvider() override = default;

    FileEntryList listEntries(const std::string& root) override;
    void fetchFile(const FileEntry& entry, const std::string& targetPath) override;
    std::string describe() const override;

    // Converts a /Look response; a malformed item raises TransportError.
    static FileEntryList parseListing(const nlohmann::json& listing, const std::string& root);

private:
    std::unique_ptr<AgentRestClient> client_;
};
