#pragma once

#include "backup/backup_plan.hpp"
#include "backup/directory_provider.hpp"
#include "common/service_config.hpp"
#include <functional>
#include <memory>

using ProviderFactory = std::function<std::unique_ptr<DirectoryProvider>(const TransportConfig&)>;

// Builds the provider variant named by transport.kind.
std::unique_ptr<DirectoryProvider> createDirectoryProvider(const TransportConfig& transport,
                                                           const ServiceConfig& config);

// Factory bound to one service configuration, as consumed by TransferExecutor.
ProviderFactory makeProviderFactory(const ServiceConfig& config);
