/**
 * rro CLI - Entry Point
 *
 * Builds signed resource overlays and probes overlay backends.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace rro::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_manifest(CLI::App* app, GlobalOptions& opts);
    void setup_backend(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace rro::cli;

    CLI::App app{"rro - runtime resource overlay builder"};
    app.set_version_flag("-V,--version", RRO_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    auto* build_cmd = app.add_subcommand("build", "Compile, align and sign an overlay");
    commands::setup_build(build_cmd, opts);

    auto* manifest_cmd = app.add_subcommand("manifest", "Print the generated overlay manifest");
    commands::setup_manifest(manifest_cmd, opts);

    auto* backend_cmd = app.add_subcommand("backend", "Select the overlay backend for an environment");
    commands::setup_backend(backend_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
