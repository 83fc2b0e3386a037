#pragma once

#include "rro/overlay_spec.hpp"
#include "rro/preferences.hpp"
#include "rro/tool_exec.hpp"
#include "rro/toolchain.hpp"
#include "rro/types.hpp"

#include <string>
#include <vector>

namespace rro {

// stderr text aapt prints when the modern encoding rejects a resource type
inline constexpr const char* LEGACY_COMPILE_MARKER = "types not allowed";

// ============================================================================
// Artifact Layout
// ============================================================================

struct OverlayArtifacts {
    std::string unsigned_apk;   // <out>/<pkg>-unsigned.apk
    std::string aligned_apk;    // <out>/<pkg>-unsigned-aligned.apk
    std::string signed_apk;     // <out>/<pkg>.apk
};

OverlayArtifacts overlay_artifacts(const std::string& output_dir, const std::string& package_name);

// ============================================================================
// Compile Stage
// ============================================================================

/**
 * Arguments for one `aapt p` run. Extra base packages are only passed when
 * not compiling in legacy mode, and only those that exist on disk.
 */
std::vector<std::string> build_compile_args(const OverlaySpec& spec,
                                            const std::string& manifest_path,
                                            const std::string& unsigned_apk,
                                            const std::string& framework_package,
                                            bool legacy);

/**
 * Compile the overlay resources into the unsigned archive.
 *
 * The compiler runs in modern mode first. If it reports LEGACY_COMPILE_MARKER
 * and PREF_FORCE_NEW_COMPILER is unset, it is run once more in legacy mode;
 * there is never a third run. Any other stderr line fails the build.
 *
 * On success the Result carries the unsigned archive path.
 */
Result compile_overlay(const OverlaySpec& spec,
                       const std::string& work_dir,
                       ToolInvoker& tools,
                       const Toolchain& toolchain,
                       const Preferences& preferences);

} // namespace rro
