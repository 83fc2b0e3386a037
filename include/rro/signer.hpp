#pragma once

#include "rro/tool_exec.hpp"
#include "rro/toolchain.hpp"

#include <string>
#include <utility>

namespace rro {

// ============================================================================
// Artifact Signing
// ============================================================================

struct SignResult {
    bool ok = false;
    std::string error;
};

class ArtifactSigner {
public:
    virtual ~ArtifactSigner() = default;

    // Sign `input` and write the signed archive to `output`
    virtual SignResult sign(const std::string& input, const std::string& output) = 0;
};

/**
 * Signs with apksigner:
 *   apksigner sign --ks <keystore> --ks-key-alias <alias>
 *                  --ks-pass pass:<password> --out <output> <input>
 */
class ApkSignerTool : public ArtifactSigner {
public:
    ApkSignerTool(ToolInvoker& tools, std::string apksigner, SigningKey key)
        : tools_(tools), apksigner_(std::move(apksigner)), key_(std::move(key)) {}

    SignResult sign(const std::string& input, const std::string& output) override;

private:
    ToolInvoker& tools_;
    std::string apksigner_;
    SigningKey key_;
};

} // namespace rro
