#include "rro/types.hpp"

#include <algorithm>
#include <cctype>

namespace rro {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Vendor> parse_vendor(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "generic" || lower.empty()) return Vendor::Generic;
    if (lower == "samsung") return Vendor::Samsung;
    return std::nullopt;
}

std::optional<BackendKind> parse_backend_kind(const std::string& s) {
    std::string lower = to_lower(s);

    if (lower == "vendor_companion") return BackendKind::VendorCompanion;
    if (lower == "companion") return BackendKind::Companion;
    if (lower == "system_service") return BackendKind::SystemService;
    if (lower == "root") return BackendKind::Root;
    if (lower == "legacy_root") return BackendKind::LegacyRoot;
    if (lower == "companion_app") return BackendKind::CompanionApp;

    return std::nullopt;
}

} // namespace rro
