#include "rro/post_process.hpp"
#include "rro/compile.hpp"
#include "rro/platform.hpp"

#include <spdlog/spdlog.h>

namespace rro {

Result finish_overlay(const std::string& unsigned_apk,
                      const std::string& out_dir,
                      const std::string& package_name,
                      ToolInvoker& tools,
                      const std::string& zipalign,
                      ArtifactSigner& signer) {
    auto artifacts = overlay_artifacts(out_dir, package_name);

    // Intermediates never outlive this call
    ScopedPath unsigned_guard(unsigned_apk);
    ScopedPath aligned_guard(artifacts.aligned_apk);

    auto align = tools.run(zipalign, {"-f", "4", unsigned_apk, artifacts.aligned_apk});
    if (!align.ok) {
        spdlog::error("Running {} failed: {}", zipalign, align.error);
    }
    if (!is_regular_file(artifacts.aligned_apk)) {
        return Failure{"Failed to zipalign overlay"};
    }

    // Sign next to the final path, then rename into place
    ScopedPath staged(make_temp_filename(artifacts.signed_apk));
    auto signed_result = signer.sign(artifacts.aligned_apk, staged.path());
    if (!signed_result.ok || !is_regular_file(staged.path())) {
        spdlog::error("Signing {} failed: {}", artifacts.aligned_apk, signed_result.error);
        return Failure{"Failed to sign overlay"};
    }

    auto published = atomic_publish_file(staged.path(), artifacts.signed_apk);
    if (!published.ok) {
        spdlog::error("Publishing {} failed: {}", artifacts.signed_apk, published.error);
        return Failure{"Failed to publish overlay"};
    }
    staged.release();

    spdlog::info("Built overlay {}", artifacts.signed_apk);
    return Success{artifacts.signed_apk};
}

} // namespace rro
