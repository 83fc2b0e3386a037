/**
 * rro CLI - manifest command
 *
 * Print the AndroidManifest.xml an overlay file would compile with.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <rro/config.hpp>
#include <rro/manifest.hpp>

namespace rro::cli::commands {

namespace {

struct ManifestOptions {
    std::string config;
};

int cmd_manifest(const GlobalOptions& opts, const ManifestOptions& manifest_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto content = read_file(manifest_opts.config);
    if (!content) {
        print_error("Failed to read " + manifest_opts.config, opts.json);
        return 1;
    }

    auto parsed = parse_build_config(*content, get_parent_directory(absolute_path(manifest_opts.config)));
    get_warning_collector().add_all(parsed.warnings);
    if (!parsed.ok) {
        print_error("Invalid overlay file: " + parsed.error, opts.json);
        return 1;
    }

    std::string manifest = generate_manifest(parsed.config.spec, parsed.config.platform);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["manifest"] = manifest;
        output_json(j);
    } else {
        std::cout << manifest;
    }
    return 0;
}

} // anonymous namespace

void setup_manifest(CLI::App* app, GlobalOptions& opts) {
    static ManifestOptions manifest_opts;

    app->add_option("config", manifest_opts.config, "Overlay file (rro.overlay.v1)")->required();

    app->callback([&opts]() {
        std::exit(cmd_manifest(opts, manifest_opts));
    });
}

} // namespace rro::cli::commands
