#include "rro/toolchain.hpp"
#include "rro/platform.hpp"
#include "rro/types.hpp"

namespace rro {

Toolchain resolve_default_toolchain() {
    Toolchain toolchain;
    toolchain.aapt = find_executable("aapt").value_or("");
    toolchain.zipalign = find_executable("zipalign").value_or("");
    toolchain.apksigner = find_executable("apksigner").value_or("");
    toolchain.framework_package = DEFAULT_FRAMEWORK_PACKAGE;
    return toolchain;
}

} // namespace rro
