#pragma once

#include <memory>
#include <string>

#include "common/cancellation.hpp"
#include "common/models.hpp"
#include "supervisor/collaborators.hpp"
#include "supervisor/domain_registry.hpp"

namespace syncwarden {

struct StartupSnapshot {
    DeviceMap devices;
    FolderMap folders;
    ServiceVersion version;
};

// Expands a leading "~" against the service's home directory. Other paths are
// returned unchanged.
std::string resolveFolderPath(const std::string &path, const std::string &tilde);

// Fetches configuration, system info, version and connections in parallel,
// then every folder's ignores, and builds fresh registry maps from them.
// Throws OperationCancelledError if token is cancelled around the joins.
StartupSnapshot loadStartupSnapshot(const std::shared_ptr<ApiClient> &client,
                                    const CancellationToken &token);

} // namespace syncwarden
