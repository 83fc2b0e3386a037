#pragma once

#include "rro/types.hpp"

namespace rro {

// ============================================================================
// Platform Profile
// ============================================================================

/**
 * The device-facing facts the manifest and the backend resolver branch on.
 * Passed explicitly so both stay testable without a device.
 */
struct PlatformProfile {
    Vendor vendor = Vendor::Generic;
    bool synergy = false;       // Vendor overlay manager without root (Samsung)
    int sdk_int = SDK_Q;

    bool is_samsung() const { return vendor == Vendor::Samsung; }
    bool is_at_least_pie() const { return sdk_int >= SDK_PIE; }
};

} // namespace rro
