#pragma once

#include "rro/host_environment.hpp"
#include "rro/overlay_spec.hpp"
#include "rro/platform_profile.hpp"
#include "rro/preferences.hpp"
#include "rro/toolchain.hpp"

#include <string>
#include <vector>

namespace rro {

// ============================================================================
// Overlay Build File ("$schema": "rro.overlay.v1")
// ============================================================================
//
// {
//   "$schema": "rro.overlay.v1",
//   "overlay": {
//     "package": "com.example.overlay",          (required)
//     "target": "com.android.systemui",          (required)
//     "timestamp": 1700000000000,                (default: now)
//     "version_code": 1, "version_name": "1.0", "label": "Example",
//     "metadata": { "key": "value", ... },       (order kept)
//     "output_dir": "out",
//     "resource_dirs": ["res"], "asset_dir": "assets",
//     "extra_base_packages": ["/system/app/SystemUI/SystemUI.apk"]
//   },
//   "toolchain": {
//     "aapt": "...", "zipalign": "...", "apksigner": "...",
//     "framework_package": "...",
//     "keystore": { "path": "...", "alias": "...", "password": "..." }
//   },
//   "platform": { "vendor": "samsung", "synergy": false, "sdk": 29 }
// }
//
// Relative paths are resolved against `base_dir`.

struct BuildConfig {
    OverlaySpec spec;
    Toolchain toolchain;
    PlatformProfile platform;
};

struct BuildConfigParseResult {
    bool ok = false;
    std::string error;
    BuildConfig config;
    std::vector<std::string> warnings;
};

BuildConfigParseResult parse_build_config(const std::string& json_str,
                                          const std::string& base_dir = "");

// ============================================================================
// Environment File ("$schema": "rro.environment.v1")
// ============================================================================
//
// {
//   "$schema": "rro.environment.v1",
//   "platform": { "vendor": "generic", "synergy": false, "sdk": 27 },
//   "companion_socket": "/run/companion.sock",
//   "system_service_path": "...",
//   "companion_app_path": "...",
//   "granted_permissions": ["rro.permission.COMPANION_ACCESS"],
//   "search_path": "/sbin:/system/xbin"
// }

struct EnvironmentConfigParseResult {
    bool ok = false;
    std::string error;
    EnvironmentConfig config;
    std::vector<std::string> warnings;
};

EnvironmentConfigParseResult parse_environment_config(const std::string& json_str);

// ============================================================================
// Preferences File (flat object; booleans are kept, other values ignored)
// ============================================================================

struct PreferencesParseResult {
    bool ok = false;
    std::string error;
    MapPreferences preferences;
    std::vector<std::string> warnings;
};

PreferencesParseResult parse_preferences(const std::string& json_str);

} // namespace rro
