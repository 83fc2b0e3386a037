#include "rro/config.hpp"
#include "rro/platform.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <set>

#include <nlohmann/json.hpp>

namespace rro {

namespace {

// ordered_json keeps metadata in declaration order
using json = nlohmann::ordered_json;

std::optional<std::string> get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

// Integer value that fits in an int; get<int>() would wrap silently
std::optional<int> get_int(const json& value) {
    if (value.is_number_unsigned()) {
        auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(v);
    }
    auto v = value.get<std::int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(v);
}

void warn_unknown_fields(const json& j, const std::set<std::string>& known,
                         const std::string& prefix, std::vector<std::string>& warnings) {
    for (const auto& [key, _] : j.items()) {
        if (known.find(key) == known.end()) {
            warnings.push_back("unknown field '" + prefix + key + "' (ignored)");
        }
    }
}

std::string resolve_path(const std::string& base_dir, const std::string& path) {
    if (base_dir.empty() || path.empty() || std::filesystem::path(path).is_absolute()) {
        return path;
    }
    return join_path(base_dir, path);
}

PlatformProfile parse_platform(const json& j, std::vector<std::string>& warnings) {
    PlatformProfile platform;
    if (!j.is_object()) {
        return platform;
    }

    warn_unknown_fields(j, {"vendor", "synergy", "sdk"}, "platform.", warnings);

    if (auto vendor = get_string(j, "vendor")) {
        if (auto parsed = parse_vendor(*vendor)) {
            platform.vendor = *parsed;
        } else {
            warnings.push_back("invalid_configuration:unknown_vendor:" + *vendor);
        }
    }
    if (j.contains("synergy") && j["synergy"].is_boolean()) {
        platform.synergy = j["synergy"].get<bool>();
    }
    if (j.contains("sdk") && j["sdk"].is_number_integer()) {
        if (auto sdk = get_int(j["sdk"])) {
            platform.sdk_int = *sdk;
        } else {
            warnings.push_back("platform.sdk is out of range (ignored)");
        }
    }
    return platform;
}

bool check_schema(const json& j, const char* expected, std::string& error) {
    auto schema = get_string(j, "$schema");
    if (!schema) {
        error = "$schema missing";
        return false;
    }
    if (*schema != expected) {
        error = std::string("$schema mismatch: expected ") + expected;
        return false;
    }
    return true;
}

} // namespace

// ============================================================================
// Overlay Build File
// ============================================================================

BuildConfigParseResult parse_build_config(const std::string& json_str, const std::string& base_dir) {
    BuildConfigParseResult result;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }
        if (!check_schema(j, "rro.overlay.v1", result.error)) {
            return result;
        }
        warn_unknown_fields(j, {"$schema", "overlay", "toolchain", "platform"}, "", result.warnings);

        if (!j.contains("overlay") || !j["overlay"].is_object()) {
            result.error = "missing \"overlay\" section";
            return result;
        }
        const auto& overlay = j["overlay"];
        warn_unknown_fields(overlay,
                            {"package", "target", "timestamp", "version_code", "version_name",
                             "label", "metadata", "output_dir", "resource_dirs", "asset_dir",
                             "extra_base_packages"},
                            "overlay.", result.warnings);

        auto package = get_string(overlay, "package");
        if (!package || package->empty()) {
            result.error = "missing required field: overlay.package";
            return result;
        }
        auto target = get_string(overlay, "target");
        if (!target || target->empty()) {
            result.error = "missing required field: overlay.target";
            return result;
        }

        long long timestamp = current_time_millis();
        if (overlay.contains("timestamp") && overlay["timestamp"].is_number_integer()) {
            timestamp = overlay["timestamp"].get<long long>();
        }

        OverlaySpecBuilder builder(*package, *target, timestamp);

        if (overlay.contains("version_code") && overlay["version_code"].is_number_integer()) {
            if (auto code = get_int(overlay["version_code"])) {
                builder.version_code(*code);
            } else {
                result.warnings.push_back("overlay.version_code is out of range (ignored)");
            }
        }
        if (auto name = get_string(overlay, "version_name")) {
            builder.version_name(*name);
        }
        if (auto label = get_string(overlay, "label")) {
            builder.label(*label);
        }

        if (overlay.contains("metadata") && overlay["metadata"].is_object()) {
            for (const auto& [key, val] : overlay["metadata"].items()) {
                if (val.is_string()) {
                    builder.add_metadata(key, val.get<std::string>());
                } else {
                    result.warnings.push_back("overlay.metadata." + key + " is not a string (ignored)");
                }
            }
        }

        if (auto out = get_string(overlay, "output_dir")) {
            builder.output_dir(resolve_path(base_dir, *out));
        }
        for (const auto& dir : get_string_array(overlay, "resource_dirs")) {
            builder.add_resource_dir(resolve_path(base_dir, dir));
        }
        if (auto assets = get_string(overlay, "asset_dir")) {
            builder.set_asset_dir(resolve_path(base_dir, *assets));
        }
        for (const auto& base : get_string_array(overlay, "extra_base_packages")) {
            builder.add_extra_base_package(resolve_path(base_dir, base));
        }

        result.config.spec = builder.build();

        auto validation = validate_overlay_spec(result.config.spec);
        if (!validation.ok) {
            result.error = validation.error;
            return result;
        }

        // "toolchain" section; anything omitted comes from PATH
        result.config.toolchain = resolve_default_toolchain();
        if (j.contains("toolchain") && j["toolchain"].is_object()) {
            const auto& tc = j["toolchain"];
            warn_unknown_fields(tc, {"aapt", "zipalign", "apksigner", "framework_package", "keystore"},
                                "toolchain.", result.warnings);

            auto& toolchain = result.config.toolchain;
            if (auto v = get_string(tc, "aapt")) toolchain.aapt = resolve_path(base_dir, *v);
            if (auto v = get_string(tc, "zipalign")) toolchain.zipalign = resolve_path(base_dir, *v);
            if (auto v = get_string(tc, "apksigner")) toolchain.apksigner = resolve_path(base_dir, *v);
            if (auto v = get_string(tc, "framework_package")) toolchain.framework_package = *v;

            if (tc.contains("keystore") && tc["keystore"].is_object()) {
                const auto& ks = tc["keystore"];
                if (auto v = get_string(ks, "path")) toolchain.key.keystore = resolve_path(base_dir, *v);
                if (auto v = get_string(ks, "alias")) toolchain.key.alias = *v;
                if (auto v = get_string(ks, "password")) toolchain.key.password = *v;
            }
        }

        if (j.contains("platform")) {
            result.config.platform = parse_platform(j["platform"], result.warnings);
        }

        result.ok = true;
    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

// ============================================================================
// Environment File
// ============================================================================

EnvironmentConfigParseResult parse_environment_config(const std::string& json_str) {
    EnvironmentConfigParseResult result;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }
        if (!check_schema(j, "rro.environment.v1", result.error)) {
            return result;
        }
        warn_unknown_fields(j,
                            {"$schema", "platform", "companion_socket", "system_service_path",
                             "companion_app_path", "granted_permissions", "search_path"},
                            "", result.warnings);

        auto& config = result.config;
        if (j.contains("platform")) {
            config.platform = parse_platform(j["platform"], result.warnings);
        }
        config.companion_socket = get_string(j, "companion_socket").value_or("");
        config.system_service_path = get_string(j, "system_service_path").value_or("");
        config.companion_app_path = get_string(j, "companion_app_path").value_or("");
        config.granted_permissions = get_string_array(j, "granted_permissions");
        config.search_path = get_string(j, "search_path").value_or("");

        result.ok = true;
    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

// ============================================================================
// Preferences File
// ============================================================================

PreferencesParseResult parse_preferences(const std::string& json_str) {
    PreferencesParseResult result;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        for (const auto& [key, val] : j.items()) {
            if (val.is_boolean()) {
                result.preferences.set_boolean(key, val.get<bool>());
            } else {
                result.warnings.push_back("preference '" + key + "' is not a boolean (ignored)");
            }
        }

        result.ok = true;
    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

} // namespace rro
