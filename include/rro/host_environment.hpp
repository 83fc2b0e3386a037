#pragma once

#include "rro/capability_resolver.hpp"
#include "rro/platform_profile.hpp"

#include <string>
#include <vector>

namespace rro {

// ============================================================================
// Host Environment
// ============================================================================

struct EnvironmentConfig {
    PlatformProfile platform;
    std::string companion_socket;       // UNIX socket of the companion service
    std::string system_service_path;    // Present when the platform bridge is installed
    std::string companion_app_path;     // Present when the companion app is installed
    std::vector<std::string> granted_permissions;
    std::string search_path;            // Scanned for su; process PATH if empty
};

/**
 * Environment backed by the local filesystem. Service reachability and the
 * bridge check are evaluated at most once per environment.
 */
Environment make_host_environment(const EnvironmentConfig& config);

// connect() to a UNIX stream socket, closing it again
bool probe_unix_socket(const std::string& path);

} // namespace rro
