#include "backup/directory_provider_factory.hpp"
#include "backup/http_directory_provider.hpp"
#include "backup/ssh_directory_provider.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"

std::unique_ptr<DirectoryProvider> createDirectoryProvider(const TransportConfig& transport,
                                                           const ServiceConfig& config) {
    Logger::info("Creating directory provider of type: " +
                 std::string(transportKindToString(transport.kind)));

    if (transport.kind == TransportKind::AgentHttp) {
        if (transport.address.empty() || transport.token.empty()) {
            throw ConfigurationError("Agent transport requires an address and a token");
        }
        AgentClientOptions options;
        options.connectTimeoutSeconds = config.connectTimeoutSeconds;
        options.listTimeoutSeconds = config.listTimeoutSeconds;
        options.transferTimeoutSeconds = config.transferTimeoutSeconds;
        options.verifyTls = config.verifyTls;
        options.caBundle = config.caBundle;
        return std::make_unique<HttpDirectoryProvider>(transport.address, transport.token, options);
    }

    SshOptions options;
    options.connectTimeoutSeconds = config.connectTimeoutSeconds;
    options.listTimeoutSeconds = config.listTimeoutSeconds;
    options.transferTimeoutSeconds = config.transferTimeoutSeconds;
    return std::make_unique<SshDirectoryProvider>(transport, options);
}

ProviderFactory makeProviderFactory(const ServiceConfig& config) {
    return [config](const TransportConfig& transport) {
        return createDirectoryProvider(transport, config);
    };
}
