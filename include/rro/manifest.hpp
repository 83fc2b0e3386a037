#pragma once

#include "rro/overlay_spec.hpp"
#include "rro/platform_profile.hpp"

#include <string>

namespace rro {

inline constexpr const char* MANIFEST_FILENAME = "AndroidManifest.xml";

// ============================================================================
// Overlay Manifest Generation
// ============================================================================

// Target packages that ship as standalone overlays on Samsung and must not
// request the vendor overlay permission
bool is_vendor_permission_exempt(const std::string& target_package);

// True when the manifest must request VENDOR_OVERLAY_PERMISSION
bool needs_vendor_permission(const PlatformProfile& platform, const std::string& target_package);

// True when the manifest must carry <uses-sdk android:targetSdkVersion>
bool needs_target_sdk(const PlatformProfile& platform);

// Serialize the overlay's AndroidManifest.xml
std::string generate_manifest(const OverlaySpec& spec, const PlatformProfile& platform);

struct ManifestWriteResult {
    bool ok = false;
    std::string error;
    std::string path;
};

// Generate and write <work_dir>/AndroidManifest.xml
ManifestWriteResult write_manifest(const OverlaySpec& spec,
                                   const PlatformProfile& platform,
                                   const std::string& work_dir);

} // namespace rro
