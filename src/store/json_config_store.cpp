#include "store/json_config_store.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json emptyDocument() {
    return json{
        {"agents", json::array()},
        {"plans", json::array()},
        {"pairing", json{{"codes", json::array()}, {"token", nullptr}}}
    };
}

template <typename T>
std::vector<T> readArray(const json& doc, const char* key) {
    std::vector<T> items;
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return items;
    }
    try {
        for (const auto& item : *it) {
            items.push_back(item.get<T>());
        }
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigurationError(std::string("Invalid entry in '") + key + "': " + e.what());
    }
    return items;
}

json& arrayAt(json& doc, const char* key) {
    if (!doc.contains(key) || !doc[key].is_array()) {
        doc[key] = json::array();
    }
    return doc[key];
}

template <typename T>
bool upsertById(json& array, const T& item) {
    for (auto& existing : array) {
        if (existing.value("id", std::string()) == item.id) {
            existing = json(item);
            return false;
        }
    }
    array.push_back(json(item));
    return true;
}

bool eraseById(json& array, const std::string& id) {
    for (auto it = array.begin(); it != array.end(); ++it) {
        if (it->value("id", std::string()) == id) {
            array.erase(it);
            return true;
        }
    }
    return false;
}

} // namespace

JsonConfigStore::JsonConfigStore(const std::string& path) : path_(path) {
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw PersistenceError("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }
}

json JsonConfigStore::load() const {
    if (!fs::exists(path_)) {
        return emptyDocument();
    }
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw PersistenceError("Cannot open configuration store " + path_);
    }
    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Malformed configuration store " + path_ + ": " + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigurationError("Configuration store root must be a JSON object: " + path_);
    }
    return doc;
}

void JsonConfigStore::save(const json& doc) const {
    std::string error;
    if (!utils::writeFileAtomically(path_, doc.dump(2), error)) {
        throw PersistenceError(error);
    }
}

std::unique_ptr<utils::FileLock> JsonConfigStore::lockStore(bool exclusive) const {
    try {
        return std::make_unique<utils::FileLock>(path_ + ".lock", exclusive);
    } catch (const std::system_error& e) {
        throw PersistenceError(e.what());
    }
}

std::vector<BackupPlan> JsonConfigStore::listPlans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(false);
    return readArray<BackupPlan>(load(), "plans");
}

std::optional<BackupPlan> JsonConfigStore::findPlan(const std::string& planId) const {
    for (auto& plan : listPlans()) {
        if (plan.id == planId) {
            return plan;
        }
    }
    return std::nullopt;
}

void JsonConfigStore::savePlan(const BackupPlan& plan) {
    if (plan.id.empty()) {
        throw ConfigurationError("Plan id must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    json doc = load();
    if (upsertById(arrayAt(doc, "plans"), plan)) {
        Logger::info("Added plan " + plan.id + " (" + plan.name + ")");
    }
    save(doc);
}

bool JsonConfigStore::removePlan(const std::string& planId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    json doc = load();
    if (!eraseById(arrayAt(doc, "plans"), planId)) {
        return false;
    }
    save(doc);
    return true;
}

std::vector<Agent> JsonConfigStore::listAgents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(false);
    return readArray<Agent>(load(), "agents");
}

std::optional<Agent> JsonConfigStore::findAgent(const std::string& agentId) const {
    for (auto& agent : listAgents()) {
        if (agent.id == agentId) {
            return agent;
        }
    }
    return std::nullopt;
}

void JsonConfigStore::saveAgent(const Agent& agent) {
    if (agent.id.empty()) {
        throw ConfigurationError("Agent id must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    json doc = load();
    if (upsertById(arrayAt(doc, "agents"), agent)) {
        Logger::info("Added agent " + agent.id + " (" + agent.name + ")");
    }
    save(doc);
}

bool JsonConfigStore::removeAgent(const std::string& agentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    json doc = load();
    if (!eraseById(arrayAt(doc, "agents"), agentId)) {
        return false;
    }
    for (auto& plan : arrayAt(doc, "plans")) {
        auto ref = plan.find("agentId");
        if (ref != plan.end() && ref->is_string() && ref->get<std::string>() == agentId) {
            *ref = nullptr;
            Logger::info("Plan " + plan.value("id", std::string()) +
                         " falls back to inline transport after removal of agent " + agentId);
        }
    }
    save(doc);
    return true;
}

bool JsonConfigStore::updateAgentToken(const std::string& agentId,
                                       const std::optional<std::string>& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    json doc = load();
    for (auto& agent : arrayAt(doc, "agents")) {
        if (agent.value("id", std::string()) == agentId) {
            agent["token"] = token ? json(*token) : json(nullptr);
            save(doc);
            return true;
        }
    }
    return false;
}

std::vector<PairingCode> JsonConfigStore::listPairingCodes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(false);
    json doc = load();
    auto pairing = doc.find("pairing");
    if (pairing == doc.end() || !pairing->is_object()) {
        return {};
    }
    return readArray<PairingCode>(*pairing, "codes");
}

void JsonConfigStore::replacePairingCodes(const std::vector<PairingCode>& codes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    json doc = load();
    if (!doc.contains("pairing") || !doc["pairing"].is_object()) {
        doc["pairing"] = json::object();
    }
    doc["pairing"]["codes"] = codes;
    save(doc);
}

std::optional<AgentToken> JsonConfigStore::loadToken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(false);
    json doc = load();
    auto pairing = doc.find("pairing");
    if (pairing == doc.end() || !pairing->is_object()) {
        return std::nullopt;
    }
    auto token = pairing->find("token");
    if (token == pairing->end() || token->is_null()) {
        return std::nullopt;
    }
    try {
        return token->get<AgentToken>();
    } catch (const std::exception& e) {
        throw ConfigurationError("Invalid stored agent token: " + std::string(e.what()));
    }
}

void JsonConfigStore::storeToken(const std::optional<AgentToken>& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    json doc = load();
    if (!doc.contains("pairing") || !doc["pairing"].is_object()) {
        doc["pairing"] = json::object();
    }
    doc["pairing"]["token"] = token ? json(*token) : json(nullptr);
    save(doc);
}
