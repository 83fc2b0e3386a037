#pragma once

#include "rro/overlay_spec.hpp"
#include "rro/platform_profile.hpp"
#include "rro/preferences.hpp"
#include "rro/signer.hpp"
#include "rro/tool_exec.hpp"
#include "rro/toolchain.hpp"
#include "rro/types.hpp"

#include <string>

namespace rro {

// ============================================================================
// Overlay Builder
// ============================================================================

struct BuilderOptions {
    Toolchain toolchain;
    PlatformProfile platform;
    std::string work_root;      // Parent of the scratch directory; temp dir if empty
};

/**
 * Runs manifest generation, compilation and post-processing for one overlay.
 *
 * Each builder owns its own scratch directory, so distinct builders may run
 * concurrently. A single builder must not run exec() concurrently.
 */
class OverlayBuilder {
public:
    OverlayBuilder(OverlaySpec spec,
                   BuilderOptions options,
                   ToolInvoker& tools,
                   ArtifactSigner& signer,
                   const Preferences& preferences);

    // Success carries the signed overlay path; the first failure is returned as is
    Result exec();

    const OverlaySpec& spec() const { return spec_; }

    // Scratch directory; exists only while exec() runs
    const std::string& work_dir() const { return work_dir_; }

private:
    OverlaySpec spec_;
    BuilderOptions options_;
    ToolInvoker& tools_;
    ArtifactSigner& signer_;
    const Preferences& preferences_;
    std::string work_dir_;
};

} // namespace rro
