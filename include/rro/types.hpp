#pragma once

#include <optional>
#include <string>
#include <variant>

namespace rro {

// ============================================================================
// Well-known Names
// ============================================================================

// Vendor permission required for overlays to be honoured on Samsung builds
inline constexpr const char* VENDOR_OVERLAY_PERMISSION =
    "com.samsung.android.permission.SAMSUNG_OVERLAY_COMPONENT";

// Declared by every overlay so installed overlays can be listed
inline constexpr const char* OVERLAY_PERMISSION = "rro.permission.OVERLAY";

// Runtime permission gating the companion service backends
inline constexpr const char* COMPANION_ACCESS_PERMISSION = "rro.permission.COMPANION_ACCESS";

inline constexpr const char* METADATA_INSTALL_TIMESTAMP = "rro.overlay.INSTALL_TIMESTAMP";

inline constexpr const char* ANDROID_NAMESPACE = "http://schemas.android.com/apk/res/android";

inline constexpr const char* DEFAULT_FRAMEWORK_PACKAGE = "/system/framework/framework-res.apk";

// SDK levels the manifest and resolver branch on
inline constexpr int SDK_PIE = 28;
inline constexpr int SDK_Q = 29;

// ============================================================================
// Pipeline Result
// ============================================================================

// Artifact produced (or, internally, the artifact handed to the next stage)
struct Success {
    std::string path;
};

struct Failure {
    std::string message;
};

using Result = std::variant<Success, Failure>;

inline bool is_success(const Result& result) {
    return std::holds_alternative<Success>(result);
}

// ============================================================================
// Platform Vendor
// ============================================================================

enum class Vendor {
    Generic,
    Samsung
};

inline const char* vendor_to_string(Vendor v) {
    switch (v) {
        case Vendor::Generic: return "generic";
        case Vendor::Samsung: return "samsung";
    }
    return "generic";
}

// Parse vendor tag (case-insensitive)
std::optional<Vendor> parse_vendor(const std::string& s);

// ============================================================================
// Backend Kinds (highest priority first)
// ============================================================================

enum class BackendKind {
    VendorCompanion,   // Vendor-specific companion service, pre-Pie
    Companion,         // Generic companion service, pre-Pie
    SystemService,     // Platform service bridge
    Root,              // su on Pie and later
    LegacyRoot,        // su before Pie
    CompanionApp       // Companion application installed
};

inline const char* backend_kind_to_string(BackendKind k) {
    switch (k) {
        case BackendKind::VendorCompanion: return "vendor_companion";
        case BackendKind::Companion: return "companion";
        case BackendKind::SystemService: return "system_service";
        case BackendKind::Root: return "root";
        case BackendKind::LegacyRoot: return "legacy_root";
        case BackendKind::CompanionApp: return "companion_app";
    }
    return "unknown";
}

std::optional<BackendKind> parse_backend_kind(const std::string& s);

} // namespace rro
