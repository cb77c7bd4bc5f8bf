#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class TransportKind {
    AgentHttp,    // companion process on the agent, reached over HTTP(S)
    RemoteShell   // find listing and cat transfers over the system ssh client
};

enum class Trigger {
    Automatic,
    Manual
};

// Inline SSH credentials carried by a plan that has no agent.
struct ShellCredentials {
    std::string host;
    std::string user;
    int port = 22;
    std::string privateKey;  // key material, not a path

    bool empty() const { return host.empty(); }
    bool operator==(const ShellCredentials& other) const;
};

struct Agent {
    std::string id;
    std::string name = "New Agent";
    std::string address;     // hostname, host:port or base URL
    std::string remoteUser;
    int port = 22;
    std::string privateKey;
    std::optional<std::string> token;

    bool isPaired() const { return token && !token->empty(); }
};

struct BackupPlan {
    std::string id;
    std::string name;
    std::string description;
    std::string schedule = "0 0 * * *";
    std::string source;
    std::string destination;
    bool active = false;
    ShellCredentials inlineTransport;
    std::optional<std::string> agentId;
    std::optional<TransportKind> preferredTransport;

    bool operator==(const BackupPlan& other) const;
    bool operator!=(const BackupPlan& other) const { return !(*this == other); }
};

// The single transport configuration that is authoritative for one run.
struct TransportConfig {
    TransportKind kind = TransportKind::RemoteShell;
    std::string address;
    std::string user;
    int port = 22;
    std::string privateKey;
    std::string token;

    std::string describe() const;
};

// Agent credentials win over inline ones. Throws ConfigurationError when
// neither yields a usable transport.
TransportConfig resolveTransport(const BackupPlan& plan, const std::optional<Agent>& agent);

const char* transportKindToString(TransportKind kind);
const char* triggerToString(Trigger trigger);

void to_json(nlohmann::json& j, const Agent& agent);
void from_json(const nlohmann::json& j, Agent& agent);
void to_json(nlohmann::json& j, const BackupPlan& plan);
void from_json(const nlohmann::json& j, BackupPlan& plan);
