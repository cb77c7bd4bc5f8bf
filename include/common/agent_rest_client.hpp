#pragma once

#include <cstdio>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

struct AgentClientOptions {
    long connectTimeoutSeconds = 10;
    long listTimeoutSeconds = 30;
    long transferTimeoutSeconds = 300;
    bool verifyTls = true;
    std::string caBundle;
};

// HTTP client for the agent companion process. Every call except the pairing
// exchange carries the X-Agent-Token header. Not thread-safe: one client per run.
class AgentRestClient {
public:
    AgentRestClient(const std::string& address, const std::string& token,
                    const AgentClientOptions& options = AgentClientOptions());
    ~AgentRestClient();

    AgentRestClient(const AgentRestClient&) = delete;
    AgentRestClient& operator=(const AgentRestClient&) = delete;

    // GET /Pong
    bool ping();

    // GET /Look?dir=<path>; returns the JSON array of entries.
    nlohmann::json listDirectory(const std::string& dir);

    // GET /Download?filePath=<path>; streams the body into localPath.
    void downloadFile(const std::string& remotePath, const std::string& localPath);

    // POST /Pairing/verify {"code": ...}; returns the issued token.
    std::string verifyPairingCode(const std::string& code);

    const std::string& baseUrl() const { return baseUrl_; }
    std::string getLastError() const { return lastError_; }

    // "host" and "host:port" become "https://host[:port]"; URLs are kept as given.
    static std::string normalizeBaseUrl(const std::string& address);

private:
    long performRequest(const std::string& method, const std::string& endpoint,
                        const std::string* body, std::string* response, FILE* sink,
                        long timeoutSeconds, bool authenticated);
    std::string buildUrl(const std::string& endpoint) const;
    void throwForStatus(const std::string& operation, long httpCode, const std::string& response);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t fileWriteCallback(void* contents, size_t size, size_t nmemb, FILE* file);

    std::string baseUrl_;
    std::string token_;
    AgentClientOptions options_;
    CURL* curl_;
    std::string lastError_;
};
