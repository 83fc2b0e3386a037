#pragma once

#include <string>

namespace rro {

// ============================================================================
// Toolchain
// ============================================================================

struct SigningKey {
    std::string keystore;
    std::string alias;
    std::string password;
};

struct Toolchain {
    std::string aapt;
    std::string zipalign;
    std::string apksigner;
    std::string framework_package;   // Always compiled against (-I)
    SigningKey key;
};

// Tools looked up on PATH; empty strings where a tool is not found
Toolchain resolve_default_toolchain();

} // namespace rro
