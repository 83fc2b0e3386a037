/**
 * rro CLI - backend command
 *
 * Resolve which overlay backend an environment supports.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <rro/capability_resolver.hpp>
#include <rro/config.hpp>
#include <rro/host_environment.hpp>

namespace rro::cli::commands {

namespace {

struct BackendOptions {
    std::string environment;
    std::vector<std::string> enable;
    bool silent = false;
};

int cmd_backend(const GlobalOptions& opts, const BackendOptions& backend_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto content = read_file(backend_opts.environment);
    if (!content) {
        print_error("Failed to read " + backend_opts.environment, opts.json);
        return 1;
    }

    auto parsed = parse_environment_config(*content);
    get_warning_collector().add_all(parsed.warnings);
    if (!parsed.ok) {
        print_error("Invalid environment file: " + parsed.error, opts.json);
        return 1;
    }

    // No --enable means every backend is supported
    BackendSupport support = backend_opts.enable.empty() ? BackendSupport::all() : BackendSupport{};
    for (const auto& name : backend_opts.enable) {
        auto kind = parse_backend_kind(name);
        if (!kind) {
            print_error("Unknown backend: " + name, opts.json);
            return 1;
        }
        support.enable(*kind);
    }

    CapabilityResolver resolver(make_host_environment(parsed.config));
    bool selected = backend_opts.silent ? resolver.resolve_silently(support)
                                        : resolver.resolve(support);

    if (!selected) {
        print_error("No supported backend", opts.json);
        return 1;
    }

    auto backend = resolver.backend();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["backend"] = backend->name();
        output_json(j);
    } else {
        std::cout << backend->name() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_backend(CLI::App* app, GlobalOptions& opts) {
    static BackendOptions backend_opts;

    app->add_option("environment", backend_opts.environment, "Environment file (rro.environment.v1)")
        ->required();
    app->add_option("--enable", backend_opts.enable, "Supported backend (repeatable)");
    app->add_flag("--silent", backend_opts.silent, "Only accept already granted permissions");

    app->callback([&opts]() {
        std::exit(cmd_backend(opts, backend_opts));
    });
}

} // namespace rro::cli::commands
