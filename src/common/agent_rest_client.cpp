#include "common/agent_rest_client.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <cstring>
#include <mutex>

namespace {

std::once_flag curlInitFlag;

void ensureCurlInitialized() {
    std::call_once(curlInitFlag, [] {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

std::string describeResponse(const std::string& response) {
    try {
        auto body = nlohmann::json::parse(response);
        if (body.is_object() && body.contains("message") && body["message"].is_string()) {
            return body["message"].get<std::string>();
        }
    } catch (const nlohmann::json::exception&) {
        // not JSON, fall through to the raw text
    }
    return response.size() > 200 ? response.substr(0, 200) + "..." : response;
}

} // namespace

AgentRestClient::AgentRestClient(const std::string& address, const std::string& token,
                                 const AgentClientOptions& options)
    : baseUrl_(normalizeBaseUrl(address)), token_(token), options_(options), curl_(nullptr) {
    ensureCurlInitialized();
    curl_ = curl_easy_init();
    if (!curl_) {
        Logger::error("Failed to initialize CURL");
        throw TransportError("Failed to initialize CURL");
    }
    Logger::debug("AgentRestClient created for " + baseUrl_);
}

AgentRestClient::~AgentRestClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

std::string AgentRestClient::normalizeBaseUrl(const std::string& address) {
    std::string url = utils::trim(address);
    if (url.find("://") == std::string::npos) {
        url = "https://" + url;
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string AgentRestClient::buildUrl(const std::string& endpoint) const {
    return baseUrl_ + endpoint;
}

size_t AgentRestClient::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

size_t AgentRestClient::fileWriteCallback(void* contents, size_t size, size_t nmemb, FILE* file) {
    return fwrite(contents, size, nmemb, file) * size;
}

long AgentRestClient::performRequest(const std::string& method, const std::string& endpoint,
                                     const std::string* body, std::string* response, FILE* sink,
                                     long timeoutSeconds, bool authenticated) {
    curl_easy_reset(curl_);

    std::string url = buildUrl(endpoint);
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }
    std::string tokenHeader;
    if (authenticated) {
        tokenHeader = "X-Agent-Token: " + token_;
        headers = curl_slist_append(headers, tokenHeader.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, options_.verifyTls ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, options_.verifyTls ? 2L : 0L);
    if (!options_.caBundle.empty()) {
        curl_easy_setopt(curl_, CURLOPT_CAINFO, options_.caBundle.c_str());
    }

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body ? body->c_str() : "");
    } else if (method != "GET") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    if (sink) {
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, fileWriteCallback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, sink);
    } else {
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, response);
    }

    Logger::debug(method + " " + url);
    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        lastError_ = std::string(curl_easy_strerror(res));
        throw TransportError(method + " " + url + " failed: " + lastError_);
    }

    long httpCode = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &httpCode);
    return httpCode;
}

void AgentRestClient::throwForStatus(const std::string& operation, long httpCode,
                                     const std::string& response) {
    if (httpCode >= 200 && httpCode < 300) {
        return;
    }
    lastError_ = operation + " returned HTTP " + std::to_string(httpCode);
    if (!response.empty()) {
        lastError_ += ": " + describeResponse(response);
    }
    if (httpCode == 401) {
        throw AuthenticationError(AuthenticationError::Reason::Unauthorized,
                                  "Agent rejected token (" + lastError_ + ")");
    }
    throw TransportError(lastError_, httpCode);
}

bool AgentRestClient::ping() {
    try {
        std::string response;
        long httpCode = performRequest("GET", "/Pong", nullptr, &response, nullptr,
                                       options_.connectTimeoutSeconds, true);
        if (httpCode < 200 || httpCode >= 300) {
            lastError_ = "Ping returned HTTP " + std::to_string(httpCode);
            return false;
        }
        return true;
    } catch (const TransportError& e) {
        Logger::warning(std::string("Agent ping failed: ") + e.what());
        return false;
    }
}

nlohmann::json AgentRestClient::listDirectory(const std::string& dir) {
    std::string response;
    long httpCode = performRequest("GET", "/Look?dir=" + utils::urlEncode(dir), nullptr, &response,
                                   nullptr, options_.listTimeoutSeconds, true);
    throwForStatus("Listing " + dir, httpCode, response);

    nlohmann::json listing;
    try {
        listing = nlohmann::json::parse(response);
    } catch (const nlohmann::json::parse_error& e) {
        lastError_ = std::string("Invalid listing response: ") + e.what();
        throw TransportError(lastError_);
    }
    if (!listing.is_array()) {
        lastError_ = "Listing response is not a JSON array";
        throw TransportError(lastError_);
    }
    return listing;
}

void AgentRestClient::downloadFile(const std::string& remotePath, const std::string& localPath) {
    FILE* file = fopen(localPath.c_str(), "wb");
    if (!file) {
        lastError_ = "Cannot open " + localPath + " for writing: " + strerror(errno);
        throw TransportError(lastError_);
    }

    long httpCode = 0;
    try {
        httpCode = performRequest("GET", "/Download?filePath=" + utils::urlEncode(remotePath),
                                  nullptr, nullptr, file, options_.transferTimeoutSeconds, true);
    } catch (...) {
        fclose(file);
        throw;
    }

    bool writeFailed = ferror(file) != 0;
    if (fclose(file) != 0) {
        writeFailed = true;
    }
    throwForStatus("Download of " + remotePath, httpCode, "");
    if (writeFailed) {
        lastError_ = "Failed writing " + localPath;
        throw TransportError(lastError_);
    }
}

std::string AgentRestClient::verifyPairingCode(const std::string& code) {
    std::string body = nlohmann::json{{"code", code}}.dump();
    std::string response;
    long httpCode = performRequest("POST", "/Pairing/verify", &body, &response, nullptr,
                                   options_.connectTimeoutSeconds + options_.listTimeoutSeconds, false);

    if (httpCode == 400) {
        std::string message = describeResponse(response);
        lastError_ = message;
        auto reason = AuthenticationError::Reason::InvalidCode;
        try {
            auto parsed = nlohmann::json::parse(response);
            if (parsed.is_object() && parsed.value("reason", std::string()) == "Expired") {
                reason = AuthenticationError::Reason::Expired;
            }
        } catch (const nlohmann::json::exception&) {
            // plain-text rejection, keep InvalidCode
        }
        throw AuthenticationError(reason, "Pairing rejected by agent: " + message);
    }
    throwForStatus("Pairing", httpCode, response);

    try {
        auto parsed = nlohmann::json::parse(response);
        std::string token = parsed.at("token").get<std::string>();
        if (token.empty()) {
            throw TransportError("Agent returned an empty token");
        }
        return token;
    } catch (const nlohmann::json::exception& e) {
        lastError_ = std::string("Invalid pairing response: ") + e.what();
        throw TransportError(lastError_);
    }
}
