#pragma once

#include "rro/backend.hpp"
#include "rro/platform_profile.hpp"
#include "rro/types.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rro {

// ============================================================================
// Environment
// ============================================================================

/**
 * Runtime signals the resolver consults. Unset predicates read as false.
 */
struct Environment {
    PlatformProfile platform;

    std::function<bool()> companion_service_reachable;
    std::function<bool()> companion_service_initialize;   // May connect; side effects
    std::function<bool()> system_service_bridge_present;
    std::function<bool()> root_available;
    std::function<bool()> companion_app_installed;
    std::function<bool(const std::string&)> permission_granted;

    BackendFactory make_backend;
};

// ============================================================================
// Backend Support Flags
// ============================================================================

struct BackendSupport {
    bool vendor_companion = false;
    bool companion = false;
    bool system_service = false;
    bool root = false;
    bool legacy_root = false;
    bool companion_app = false;

    bool enabled(BackendKind kind) const;
    void enable(BackendKind kind, bool on = true);

    static BackendSupport all();
};

// ============================================================================
// Capability Checks
// ============================================================================

struct CapabilityCheck {
    BackendKind kind;
    bool enabled = false;
    std::function<bool()> predicate;
    std::string required_permission;    // Empty when the backend needs none
    std::function<std::shared_ptr<Backend>()> factory;
};

/**
 * Checks in priority order:
 *   vendor_companion, companion, system_service, root, legacy_root, companion_app
 * Predicates short-circuit, so the companion service is only initialized when
 * every cheaper condition already holds.
 */
std::vector<CapabilityCheck> build_capability_checks(const Environment& env,
                                                     const BackendSupport& support);

// su reachable through a colon-delimited search path
bool is_root_available(const std::string& path_env);

// Same, against the process PATH
bool is_root_available();

// ============================================================================
// Capability Resolver
// ============================================================================

class CapabilityResolver {
public:
    explicit CapabilityResolver(Environment env, BackendSlot& slot = process_backend_slot());

    /**
     * Select the first enabled check whose predicate holds and store its
     * backend. Returns true iff a backend is selected; once one is, later
     * calls return true without evaluating anything.
     */
    bool resolve(const BackendSupport& support);

    /**
     * Like resolve(), but a check whose backend needs a runtime permission is
     * skipped unless that permission is already granted. Never requests a
     * permission. Root backends escalate on their own and are not gated.
     */
    bool resolve_silently(const BackendSupport& support);

    std::shared_ptr<Backend> backend() const { return slot_.get(); }

private:
    bool resolve_with(const BackendSupport& support, bool check_permissions);

    Environment env_;
    BackendSlot& slot_;
};

} // namespace rro
