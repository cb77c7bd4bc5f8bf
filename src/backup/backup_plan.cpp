#include "backup/backup_plan.hpp"
#include "common/backup_errors.hpp"

using json = nlohmann::json;

bool ShellCredentials::operator==(const ShellCredentials& other) const {
    return host == other.host && user == other.user && port == other.port &&
           privateKey == other.privateKey;
}

bool BackupPlan::operator==(const BackupPlan& other) const {
    return id == other.id && name == other.name && description == other.description &&
           schedule == other.schedule && source == other.source &&
           destination == other.destination && active == other.active &&
           inlineTransport == other.inlineTransport && agentId == other.agentId &&
           preferredTransport == other.preferredTransport;
}

std::string TransportConfig::describe() const {
    if (kind == TransportKind::AgentHttp) {
        return "agent " + address;
    }
    std::string target = user.empty() ? address : user + "@" + address;
    return "ssh " + target + ":" + std::to_string(port);
}

const char* transportKindToString(TransportKind kind) {
    return kind == TransportKind::AgentHttp ? "agent" : "shell";
}

const char* triggerToString(Trigger trigger) {
    return trigger == Trigger::Automatic ? "Automatic" : "Manual";
}

TransportConfig resolveTransport(const BackupPlan& plan, const std::optional<Agent>& agent) {
    TransportConfig config;

    if (agent && !agent->address.empty()) {
        bool canHttp = agent->isPaired();
        bool canShell = !agent->remoteUser.empty() || !agent->privateKey.empty();

        if (plan.preferredTransport == TransportKind::AgentHttp && !canHttp) {
            throw ConfigurationError("Agent '" + agent->name + "' is not paired");
        }
        if (plan.preferredTransport == TransportKind::RemoteShell) {
            canHttp = false;
            canShell = true;
        }

        if (canHttp) {
            config.kind = TransportKind::AgentHttp;
            config.address = agent->address;
            config.token = *agent->token;
            return config;
        }
        if (canShell) {
            config.kind = TransportKind::RemoteShell;
            config.address = agent->address;
            config.user = agent->remoteUser;
            config.port = agent->port;
            config.privateKey = agent->privateKey;
            return config;
        }
        throw ConfigurationError("Agent '" + agent->name +
                                 "' is neither paired nor configured for remote shell access");
    }

    if (plan.preferredTransport == TransportKind::AgentHttp) {
        throw ConfigurationError("Plan '" + plan.name + "' requires an agent but none is linked");
    }
    if (plan.inlineTransport.empty()) {
        throw ConfigurationError("MissingTransportConfig: plan '" + plan.name +
                                 "' has neither an agent nor inline transport credentials");
    }

    config.kind = TransportKind::RemoteShell;
    config.address = plan.inlineTransport.host;
    config.user = plan.inlineTransport.user;
    config.port = plan.inlineTransport.port;
    config.privateKey = plan.inlineTransport.privateKey;
    return config;
}

void to_json(json& j, const Agent& agent) {
    j = json{
        {"id", agent.id},
        {"name", agent.name},
        {"address", agent.address},
        {"remoteUser", agent.remoteUser},
        {"port", agent.port},
        {"privateKey", agent.privateKey},
        {"token", agent.token ? json(*agent.token) : json(nullptr)}
    };
}

void from_json(const json& j, Agent& agent) {
    agent.id = j.at("id").get<std::string>();
    agent.name = j.value("name", std::string("New Agent"));
    agent.address = j.value("address", std::string());
    agent.remoteUser = j.value("remoteUser", std::string());
    agent.port = j.value("port", 22);
    agent.privateKey = j.value("privateKey", std::string());
    if (j.contains("token") && j["token"].is_string()) {
        agent.token = j["token"].get<std::string>();
    } else {
        agent.token.reset();
    }
}

void to_json(json& j, const BackupPlan& plan) {
    j = json{
        {"id", plan.id},
        {"name", plan.name},
        {"description", plan.description},
        {"schedule", plan.schedule},
        {"source", plan.source},
        {"destination", plan.destination},
        {"active", plan.active},
        {"shellHost", plan.inlineTransport.host},
        {"shellUser", plan.inlineTransport.user},
        {"shellPort", plan.inlineTransport.port},
        {"shellPrivateKey", plan.inlineTransport.privateKey},
        {"agentId", plan.agentId ? json(*plan.agentId) : json(nullptr)},
        {"transport", plan.preferredTransport ? json(transportKindToString(*plan.preferredTransport))
                                              : json(nullptr)}
    };
}

void from_json(const json& j, BackupPlan& plan) {
    plan.id = j.at("id").get<std::string>();
    plan.name = j.value("name", std::string());
    plan.description = j.value("description", std::string());
    plan.schedule = j.value("schedule", std::string("0 0 * * *"));
    plan.source = j.value("source", std::string());
    plan.destination = j.value("destination", std::string());
    plan.active = j.value("active", false);
    plan.inlineTransport.host = j.value("shellHost", std::string());
    plan.inlineTransport.user = j.value("shellUser", std::string());
    plan.inlineTransport.port = j.value("shellPort", 22);
    plan.inlineTransport.privateKey = j.value("shellPrivateKey", std::string());

    plan.agentId.reset();
    if (j.contains("agentId") && j["agentId"].is_string() && !j["agentId"].get<std::string>().empty()) {
        plan.agentId = j["agentId"].get<std::string>();
    }

    plan.preferredTransport.reset();
    if (j.contains("transport") && j["transport"].is_string()) {
        std::string transport = j["transport"].get<std::string>();
        if (transport == "agent") {
            plan.preferredTransport = TransportKind::AgentHttp;
        } else if (transport == "shell") {
            plan.preferredTransport = TransportKind::RemoteShell;
        } else if (!transport.empty()) {
            throw ConfigurationError("Plan '" + plan.id + "' has unknown transport '" + transport + "'");
        }
    }
}
