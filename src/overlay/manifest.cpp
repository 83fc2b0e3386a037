#include "rro/manifest.hpp"
#include "rro/platform.hpp"

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>
#include <tinyxml2.h>

namespace rro {

namespace {

// Standalone Samsung overlays that do not take the vendor permission
constexpr std::array<const char*, 2> VENDOR_PERMISSION_EXEMPT = {
    "com.sec.android.app.music",
    "com.sec.android.app.voicenote",
};

void push_name_value(tinyxml2::XMLPrinter& printer, const std::string& name, const std::string& value) {
    printer.OpenElement("meta-data");
    printer.PushAttribute("android:name", name.c_str());
    printer.PushAttribute("android:value", value.c_str());
    printer.CloseElement();
}

void push_uses_permission(tinyxml2::XMLPrinter& printer, const char* permission) {
    printer.OpenElement("uses-permission");
    printer.PushAttribute("android:name", permission);
    printer.CloseElement();
}

} // namespace

bool is_vendor_permission_exempt(const std::string& target_package) {
    return std::any_of(VENDOR_PERMISSION_EXEMPT.begin(), VENDOR_PERMISSION_EXEMPT.end(),
                       [&](const char* pkg) { return target_package == pkg; });
}

bool needs_vendor_permission(const PlatformProfile& platform, const std::string& target_package) {
    if (!platform.is_samsung()) return false;
    return !is_vendor_permission_exempt(target_package);
}

bool needs_target_sdk(const PlatformProfile& platform) {
    return platform.synergy && platform.sdk_int >= SDK_Q;
}

std::string generate_manifest(const OverlaySpec& spec, const PlatformProfile& platform) {
    tinyxml2::XMLPrinter printer;
    printer.PushHeader(false, true);

    printer.OpenElement("manifest");
    printer.PushAttribute("xmlns:android", ANDROID_NAMESPACE);
    printer.PushAttribute("package", spec.package_name.c_str());
    if (spec.version_code) {
        printer.PushAttribute("android:versionCode", std::to_string(*spec.version_code).c_str());
    }
    if (spec.version_name) {
        printer.PushAttribute("android:versionName", spec.version_name->c_str());
    }

    printer.OpenElement("overlay");
    printer.PushAttribute("android:targetPackage", spec.target_package.c_str());
    printer.CloseElement();

    // Unrooted Samsung overlays on Q and later must target the running SDK
    if (needs_target_sdk(platform)) {
        printer.OpenElement("uses-sdk");
        printer.PushAttribute("android:targetSdkVersion", std::to_string(platform.sdk_int).c_str());
        printer.CloseElement();
    }

    if (needs_vendor_permission(platform, spec.target_package)) {
        push_uses_permission(printer, VENDOR_OVERLAY_PERMISSION);
    }

    push_uses_permission(printer, OVERLAY_PERMISSION);

    printer.OpenElement("application");
    printer.PushAttribute("android:allowBackup", "false");
    printer.PushAttribute("android:hasCode", "false");
    if (spec.label) {
        printer.PushAttribute("android:label", spec.label->c_str());
    }

    for (const auto& [name, value] : spec.metadata) {
        push_name_value(printer, name, value);
    }
    push_name_value(printer, METADATA_INSTALL_TIMESTAMP, std::to_string(spec.timestamp));

    printer.CloseElement();  // application
    printer.CloseElement();  // manifest

    return std::string(printer.CStr(), static_cast<size_t>(printer.CStrSize() - 1));
}

ManifestWriteResult write_manifest(const OverlaySpec& spec,
                                   const PlatformProfile& platform,
                                   const std::string& work_dir) {
    ManifestWriteResult result;
    result.path = join_path(work_dir, MANIFEST_FILENAME);

    auto written = atomic_write_file(result.path, generate_manifest(spec, platform));
    if (!written.ok) {
        spdlog::error("Writing {} failed: {}", result.path, written.error);
        result.error = "Failed to write overlay manifest";
        return result;
    }

    spdlog::debug("Wrote manifest for {} -> {}", spec.package_name, spec.target_package);
    result.ok = true;
    return result;
}

} // namespace rro
