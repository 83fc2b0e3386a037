#include "rro/compile.hpp"
#include "rro/manifest.hpp"
#include "rro/platform.hpp"

#include <spdlog/spdlog.h>

namespace rro {

OverlayArtifacts overlay_artifacts(const std::string& output_dir, const std::string& package_name) {
    std::string out = absolute_path(output_dir);

    OverlayArtifacts artifacts;
    artifacts.unsigned_apk = join_path(out, package_name + "-unsigned.apk");
    artifacts.aligned_apk = join_path(out, package_name + "-unsigned-aligned.apk");
    artifacts.signed_apk = join_path(out, package_name + ".apk");
    return artifacts;
}

std::vector<std::string> build_compile_args(const OverlaySpec& spec,
                                            const std::string& manifest_path,
                                            const std::string& unsigned_apk,
                                            const std::string& framework_package,
                                            bool legacy) {
    std::vector<std::string> args = {"p", "-M", manifest_path};

    for (const auto& dir : spec.resource_dirs) {
        args.push_back("-S");
        args.push_back(dir);
    }

    if (spec.asset_dir && !spec.asset_dir->empty()) {
        args.push_back("-A");
        args.push_back(*spec.asset_dir);
    }

    // Framework always; the target's own packages only in modern mode
    args.push_back("-I");
    args.push_back(framework_package);
    if (!legacy) {
        for (const auto& base : spec.extra_base_packages) {
            if (path_exists(base)) {
                args.push_back("-I");
                args.push_back(base);
            } else {
                spdlog::debug("Skipping missing base package {}", base);
            }
        }
    }

    args.push_back("-F");
    args.push_back(unsigned_apk);
    args.push_back("--auto-add-overlay");
    args.push_back("-f");

    return args;
}

Result compile_overlay(const OverlaySpec& spec,
                       const std::string& work_dir,
                       ToolInvoker& tools,
                       const Toolchain& toolchain,
                       const Preferences& preferences) {
    auto artifacts = overlay_artifacts(spec.output_dir, spec.package_name);

    if (!is_directory(spec.output_dir)) {
        if (!atomic_create_directory(spec.output_dir).ok) {
            return Failure{"Failed to create overlay cache directory"};
        }
    }

    if (spec.resource_dirs.empty()) {
        return Failure{"Resource directory cannot be empty!"};
    }

    std::string manifest_path = join_path(work_dir, MANIFEST_FILENAME);
    bool force_new_compiler = preferences.get_boolean(PREF_FORCE_NEW_COMPILER, false);

    // Legacy mode can only be switched on while it is off, so this runs at most twice
    bool legacy = false;
    for (;;) {
        // Only an archive written by this attempt counts as compiled
        if (!remove_file(artifacts.unsigned_apk)) {
            spdlog::error("Could not remove stale archive {}", artifacts.unsigned_apk);
            return Failure{"Failed to compile overlay"};
        }

        auto args = build_compile_args(spec, manifest_path, artifacts.unsigned_apk,
                                       toolchain.framework_package, legacy);
        auto run = tools.run(toolchain.aapt, args);
        if (!run.ok) {
            spdlog::error("Running {} failed: {}", toolchain.aapt, run.error);
        }

        std::string error;
        bool switched = false;
        for (const auto& line : run.stderr_lines) {
            if (line.find(LEGACY_COMPILE_MARKER) != std::string::npos &&
                !legacy && !force_new_compiler) {
                legacy = true;
                switched = true;
                continue;
            }
            if (!error.empty()) error += '\n';
            error += line;
        }

        if (switched) {
            spdlog::warn("Compiler rejected resource types for {}, retrying in legacy mode",
                         spec.package_name);
            continue;
        }

        if (!error.empty()) {
            return Failure{error};
        }
        break;
    }

    if (!is_regular_file(artifacts.unsigned_apk)) {
        return Failure{"Failed to compile overlay"};
    }

    spdlog::debug("Compiled {}{}", artifacts.unsigned_apk, legacy ? " (legacy)" : "");
    return Success{artifacts.unsigned_apk};
}

} // namespace rro
