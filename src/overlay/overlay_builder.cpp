#include "rro/overlay_builder.hpp"
#include "rro/compile.hpp"
#include "rro/manifest.hpp"
#include "rro/platform.hpp"
#include "rro/post_process.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace rro {

namespace {

std::string default_work_root() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::string(".") : tmp.string();
}

} // namespace

OverlayBuilder::OverlayBuilder(OverlaySpec spec,
                               BuilderOptions options,
                               ToolInvoker& tools,
                               ArtifactSigner& signer,
                               const Preferences& preferences)
    : spec_(std::move(spec)),
      options_(std::move(options)),
      tools_(tools),
      signer_(signer),
      preferences_(preferences) {
    std::string root = options_.work_root.empty() ? default_work_root() : options_.work_root;
    work_dir_ = join_path(root, "overlay_builder-" + generate_uuid());
}

Result OverlayBuilder::exec() {
    spdlog::debug("Building overlay {} for {}", spec_.package_name, spec_.target_package);

    if (!atomic_create_directory(work_dir_).ok) {
        return Failure{"Failed to create overlay work directory"};
    }
    ScopedPath work_guard(work_dir_);

    auto manifest = write_manifest(spec_, options_.platform, work_dir_);
    if (!manifest.ok) {
        return Failure{manifest.error};
    }

    // A failed compile may still leave a partial archive behind
    auto artifacts = overlay_artifacts(spec_.output_dir, spec_.package_name);
    ScopedPath unsigned_guard(artifacts.unsigned_apk);
    ScopedPath aligned_guard(artifacts.aligned_apk);

    auto compiled = compile_overlay(spec_, work_dir_, tools_, options_.toolchain, preferences_);
    if (const auto* failure = std::get_if<Failure>(&compiled)) {
        spdlog::debug("Compile failed for {}: {}", spec_.package_name, failure->message);
        return compiled;
    }

    return finish_overlay(std::get<Success>(compiled).path,
                          spec_.output_dir,
                          spec_.package_name,
                          tools_,
                          options_.toolchain.zipalign,
                          signer_);
}

} // namespace rro
