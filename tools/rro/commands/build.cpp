/**
 * rro CLI - build command
 *
 * Compile, align and sign an overlay described by an rro.overlay.v1 file.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <rro/config.hpp>
#include <rro/overlay_builder.hpp>
#include <rro/preferences.hpp>
#include <rro/signer.hpp>
#include <rro/tool_exec.hpp>

namespace rro::cli::commands {

namespace {

struct BuildOptions {
    std::string config;
    std::string prefs;
    std::string output_dir;
    std::string work_root;
    bool force_new_compiler = false;
};

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);
    auto& warnings = get_warning_collector();

    auto content = read_file(build_opts.config);
    if (!content) {
        print_error("Failed to read " + build_opts.config, opts.json);
        return 1;
    }

    auto parsed = parse_build_config(*content, get_parent_directory(absolute_path(build_opts.config)));
    warnings.add_all(parsed.warnings);
    if (!parsed.ok) {
        print_error("Invalid overlay file: " + parsed.error, opts.json);
        return 1;
    }

    MapPreferences preferences;
    if (!build_opts.prefs.empty()) {
        auto prefs_content = read_file(build_opts.prefs);
        if (!prefs_content) {
            print_error("Failed to read " + build_opts.prefs, opts.json);
            return 1;
        }
        auto prefs = parse_preferences(*prefs_content);
        warnings.add_all(prefs.warnings);
        if (!prefs.ok) {
            print_error("Invalid preferences file: " + prefs.error, opts.json);
            return 1;
        }
        preferences = prefs.preferences;
    }
    if (build_opts.force_new_compiler) {
        preferences.set_boolean(PREF_FORCE_NEW_COMPILER, true);
    }

    auto& config = parsed.config;
    if (!build_opts.output_dir.empty()) {
        config.spec.output_dir = build_opts.output_dir;
    }

    ProcessToolInvoker tools;
    ApkSignerTool signer(tools, config.toolchain.apksigner, config.toolchain.key);

    BuilderOptions builder_opts;
    builder_opts.toolchain = config.toolchain;
    builder_opts.platform = config.platform;
    builder_opts.work_root = build_opts.work_root;

    OverlayBuilder builder(config.spec, builder_opts, tools, signer, preferences);
    auto result = builder.exec();

    if (const auto* failure = std::get_if<Failure>(&result)) {
        print_error(failure->message, opts.json);
        return 1;
    }

    const auto& path = std::get<Success>(result).path;
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["package"] = config.spec.package_name;
        j["target"] = config.spec.target_package;
        j["path"] = path;
        auto digest = compute_sha256(path);
        if (digest.ok) {
            j["sha256"] = digest.hex_digest;
        } else {
            warnings.add("could not digest " + path + ": " + digest.error);
        }
        output_json(j);
    } else {
        std::cout << path << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("config", build_opts.config, "Overlay file (rro.overlay.v1)")->required();
    app->add_option("--prefs", build_opts.prefs, "Preferences file");
    app->add_option("-o,--out", build_opts.output_dir, "Override the output directory");
    app->add_option("--work-root", build_opts.work_root, "Parent of the scratch directory");
    app->add_flag("--force-new-compiler", build_opts.force_new_compiler,
                  "Never fall back to the legacy compile mode");

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace rro::cli::commands
