#pragma once

#include "rro/signer.hpp"
#include "rro/tool_exec.hpp"
#include "rro/types.hpp"

#include <string>

namespace rro {

// ============================================================================
// Post-processing (align, sign, publish)
// ============================================================================

/**
 * zipalign the unsigned archive, sign it into a temporary file and atomically
 * rename that to <out_dir>/<package_name>.apk. Both intermediate archives are
 * removed on every exit path.
 */
Result finish_overlay(const std::string& unsigned_apk,
                      const std::string& out_dir,
                      const std::string& package_name,
                      ToolInvoker& tools,
                      const std::string& zipalign,
                      ArtifactSigner& signer);

} // namespace rro
