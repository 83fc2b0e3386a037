#include "rro/capability_resolver.hpp"
#include "rro/platform.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace rro {

namespace {

bool call(const std::function<bool()>& predicate) {
    return predicate && predicate();
}

} // namespace

// ============================================================================
// Backend Support Flags
// ============================================================================

bool BackendSupport::enabled(BackendKind kind) const {
    switch (kind) {
        case BackendKind::VendorCompanion: return vendor_companion;
        case BackendKind::Companion: return companion;
        case BackendKind::SystemService: return system_service;
        case BackendKind::Root: return root;
        case BackendKind::LegacyRoot: return legacy_root;
        case BackendKind::CompanionApp: return companion_app;
    }
    return false;
}

void BackendSupport::enable(BackendKind kind, bool on) {
    switch (kind) {
        case BackendKind::VendorCompanion: vendor_companion = on; break;
        case BackendKind::Companion: companion = on; break;
        case BackendKind::SystemService: system_service = on; break;
        case BackendKind::Root: root = on; break;
        case BackendKind::LegacyRoot: legacy_root = on; break;
        case BackendKind::CompanionApp: companion_app = on; break;
    }
}

BackendSupport BackendSupport::all() {
    BackendSupport support;
    support.vendor_companion = true;
    support.companion = true;
    support.system_service = true;
    support.root = true;
    support.legacy_root = true;
    support.companion_app = true;
    return support;
}

// ============================================================================
// Capability Checks
// ============================================================================

// The returned checks reference `env` and must not outlive it
std::vector<CapabilityCheck> build_capability_checks(const Environment& env,
                                                     const BackendSupport& support) {
    const Environment* e = &env;
    auto factory_for = [e](BackendKind kind) {
        return [e, kind]() -> std::shared_ptr<Backend> {
            auto make = e->make_backend ? e->make_backend : default_backend_factory();
            return make(kind);
        };
    };

    std::vector<CapabilityCheck> checks;

    checks.push_back({BackendKind::VendorCompanion, support.vendor_companion,
                      [e] {
                          return e->platform.is_samsung() && !e->platform.is_at_least_pie() &&
                                 call(e->companion_service_reachable) &&
                                 call(e->companion_service_initialize);
                      },
                      COMPANION_ACCESS_PERMISSION, factory_for(BackendKind::VendorCompanion)});

    checks.push_back({BackendKind::Companion, support.companion,
                      [e] {
                          return !e->platform.is_at_least_pie() &&
                                 call(e->companion_service_reachable) &&
                                 call(e->companion_service_initialize);
                      },
                      COMPANION_ACCESS_PERMISSION, factory_for(BackendKind::Companion)});

    checks.push_back({BackendKind::SystemService, support.system_service,
                      [e] { return call(e->system_service_bridge_present); },
                      "", factory_for(BackendKind::SystemService)});

    // Root backends ask for elevation themselves
    checks.push_back({BackendKind::Root, support.root,
                      [e] { return e->platform.is_at_least_pie() && call(e->root_available); },
                      "", factory_for(BackendKind::Root)});

    checks.push_back({BackendKind::LegacyRoot, support.legacy_root,
                      [e] { return !e->platform.is_at_least_pie() && call(e->root_available); },
                      "", factory_for(BackendKind::LegacyRoot)});

    checks.push_back({BackendKind::CompanionApp, support.companion_app,
                      [e] { return call(e->companion_app_installed); },
                      "", factory_for(BackendKind::CompanionApp)});

    return checks;
}

bool is_root_available(const std::string& path_env) {
    return find_in_search_path("su", path_env).has_value();
}

bool is_root_available() {
    auto path_env = get_env("PATH");
    return path_env && is_root_available(*path_env);
}

// ============================================================================
// Capability Resolver
// ============================================================================

CapabilityResolver::CapabilityResolver(Environment env, BackendSlot& slot)
    : env_(std::move(env)), slot_(slot) {}

bool CapabilityResolver::resolve(const BackendSupport& support) {
    return resolve_with(support, false);
}

bool CapabilityResolver::resolve_silently(const BackendSupport& support) {
    return resolve_with(support, true);
}

bool CapabilityResolver::resolve_with(const BackendSupport& support, bool check_permissions) {
    return slot_.set_once([&]() -> std::shared_ptr<Backend> {
        for (const auto& check : build_capability_checks(env_, support)) {
            if (!check.enabled) continue;

            if (check_permissions && !check.required_permission.empty()) {
                bool granted = env_.permission_granted &&
                               env_.permission_granted(check.required_permission);
                if (!granted) {
                    spdlog::debug("Skipping {}: {} not granted",
                                  backend_kind_to_string(check.kind), check.required_permission);
                    continue;
                }
            }

            if (!check.predicate()) continue;

            auto backend = check.factory();
            if (backend) {
                spdlog::info("Selected backend {}", backend->name());
                return backend;
            }
        }

        spdlog::debug("No supported backend");
        return nullptr;
    });
}

} // namespace rro
