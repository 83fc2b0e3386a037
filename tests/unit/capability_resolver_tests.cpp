#include <doctest/doctest.h>
#include <rro/capability_resolver.hpp>
#include <rro/host_environment.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

#include <sys/stat.h>

using namespace rro;
using namespace rro::test;

namespace {

// Every signal on; counters record how often each one is consulted
struct Signals {
    bool reachable = true;
    bool initializes = true;
    bool bridge = true;
    bool root = true;
    bool app = true;
    std::vector<std::string> granted = {COMPANION_ACCESS_PERMISSION};

    int initialize_calls = 0;
    int root_calls = 0;
    int created = 0;

    Environment environment(PlatformProfile platform) {
        Environment env;
        env.platform = platform;
        env.companion_service_reachable = [this] { return reachable; };
        env.companion_service_initialize = [this] { ++initialize_calls; return initializes; };
        env.system_service_bridge_present = [this] { return bridge; };
        env.root_available = [this] { ++root_calls; return root; };
        env.companion_app_installed = [this] { return app; };
        env.permission_granted = [this](const std::string& p) {
            return std::find(granted.begin(), granted.end(), p) != granted.end();
        };
        env.make_backend = [this](BackendKind kind) -> std::shared_ptr<Backend> {
            ++created;
            return std::make_shared<StrategyBackend>(kind);
        };
        return env;
    }
};

PlatformProfile oreo_samsung() {
    PlatformProfile p;
    p.vendor = Vendor::Samsung;
    p.sdk_int = 27;
    return p;
}

PlatformProfile pie() {
    PlatformProfile p;
    p.sdk_int = SDK_PIE;
    return p;
}

BackendKind selected(const CapabilityResolver& resolver) {
    REQUIRE(resolver.backend() != nullptr);
    return resolver.backend()->kind();
}

} // namespace

TEST_CASE("resolver picks the highest priority satisfied backend") {
    Signals s;
    BackendSlot slot;
    CapabilityResolver resolver(s.environment(oreo_samsung()), slot);

    CHECK(resolver.resolve(BackendSupport::all()));
    CHECK(selected(resolver) == BackendKind::VendorCompanion);
}

TEST_CASE("resolver priority does not depend on which flags are enabled first") {
    Signals s;
    s.reachable = false;
    BackendSlot slot;
    CapabilityResolver resolver(s.environment(pie()), slot);

    BackendSupport support;
    support.enable(BackendKind::CompanionApp);
    support.enable(BackendKind::Root);
    support.enable(BackendKind::SystemService);

    CHECK(resolver.resolve(support));
    CHECK(selected(resolver) == BackendKind::SystemService);
}

TEST_CASE("resolver skips disabled and unsatisfied checks in order") {
    Signals s;
    s.bridge = false;

    SUBCASE("root on Pie") {
        BackendSlot slot;
        CapabilityResolver resolver(s.environment(pie()), slot);
        CHECK(resolver.resolve(BackendSupport::all()));
        CHECK(selected(resolver) == BackendKind::Root);
    }

    SUBCASE("legacy root before Pie") {
        s.reachable = false;
        BackendSlot slot;
        PlatformProfile oreo;
        oreo.sdk_int = 27;
        CapabilityResolver resolver(s.environment(oreo), slot);
        CHECK(resolver.resolve(BackendSupport::all()));
        CHECK(selected(resolver) == BackendKind::LegacyRoot);
    }

    SUBCASE("companion app last") {
        s.root = false;
        BackendSlot slot;
        CapabilityResolver resolver(s.environment(pie()), slot);
        CHECK(resolver.resolve(BackendSupport::all()));
        CHECK(selected(resolver) == BackendKind::CompanionApp);
    }

    SUBCASE("vendor companion needs a Samsung device") {
        BackendSlot slot;
        PlatformProfile oreo;
        oreo.sdk_int = 27;
        CapabilityResolver resolver(s.environment(oreo), slot);
        CHECK(resolver.resolve(BackendSupport::all()));
        CHECK(selected(resolver) == BackendKind::Companion);
    }
}

TEST_CASE("companion backends are not considered on Pie") {
    Signals s;
    BackendSlot slot;
    PlatformProfile samsung_pie = pie();
    samsung_pie.vendor = Vendor::Samsung;
    CapabilityResolver resolver(s.environment(samsung_pie), slot);

    BackendSupport support;
    support.enable(BackendKind::VendorCompanion);
    support.enable(BackendKind::Companion);

    CHECK_FALSE(resolver.resolve(support));
    CHECK(s.initialize_calls == 0);
    CHECK(resolver.backend() == nullptr);
}

TEST_CASE("companion service is not initialized when it is unreachable") {
    Signals s;
    s.reachable = false;
    BackendSlot slot;
    CapabilityResolver resolver(s.environment(oreo_samsung()), slot);

    CHECK(resolver.resolve(BackendSupport::all()));
    CHECK(s.initialize_calls == 0);
    CHECK(selected(resolver) == BackendKind::SystemService);
}

TEST_CASE("resolver returns false when nothing matches") {
    Signals s;
    s.reachable = false;
    s.bridge = false;
    s.root = false;
    s.app = false;
    BackendSlot slot;
    CapabilityResolver resolver(s.environment(pie()), slot);

    CHECK_FALSE(resolver.resolve(BackendSupport::all()));
    CHECK(s.created == 0);

    // An empty slot can still be filled later
    s.app = true;
    CHECK(resolver.resolve(BackendSupport::all()));
    CHECK(selected(resolver) == BackendKind::CompanionApp);
}

TEST_CASE("resolution is memoized after the first success") {
    Signals s;
    BackendSlot slot;
    CapabilityResolver resolver(s.environment(pie()), slot);

    CHECK(resolver.resolve(BackendSupport::all()));
    auto first = resolver.backend();
    int root_calls = s.root_calls;

    CHECK(resolver.resolve(BackendSupport::all()));
    CHECK(resolver.backend() == first);
    CHECK(s.created == 1);
    CHECK(s.root_calls == root_calls);
}

TEST_CASE("selected backend survives changed signals and other resolvers") {
    Signals s;
    BackendSlot slot;
    CapabilityResolver resolver(s.environment(pie()), slot);
    REQUIRE(resolver.resolve(BackendSupport::all()));
    auto first = resolver.backend();

    Signals other;
    other.bridge = false;
    CapabilityResolver second(other.environment(pie()), slot);
    CHECK(second.resolve_silently(BackendSupport::all()));
    CHECK(second.backend() == first);
    CHECK(other.created == 0);
}

TEST_CASE("silent resolution skips companion backends without the access permission") {
    Signals s;
    s.granted.clear();

    BackendSlot direct_slot;
    CapabilityResolver direct(s.environment(oreo_samsung()), direct_slot);
    CHECK(direct.resolve(BackendSupport::all()));
    CHECK(selected(direct) == BackendKind::VendorCompanion);

    BackendSlot silent_slot;
    CapabilityResolver silent(s.environment(oreo_samsung()), silent_slot);
    CHECK(silent.resolve_silently(BackendSupport::all()));
    CHECK(selected(silent) == BackendKind::SystemService);
}

TEST_CASE("silent resolution accepts companion backends once permission is granted") {
    Signals s;
    BackendSlot slot;
    CapabilityResolver resolver(s.environment(oreo_samsung()), slot);

    CHECK(resolver.resolve_silently(BackendSupport::all()));
    CHECK(selected(resolver) == BackendKind::VendorCompanion);
}

TEST_CASE("silent resolution does not gate root backends") {
    Signals s;
    s.granted.clear();
    s.bridge = false;
    BackendSlot slot;
    PlatformProfile oreo;
    oreo.sdk_int = 27;
    CapabilityResolver resolver(s.environment(oreo), slot);

    CHECK(resolver.resolve_silently(BackendSupport::all()));
    CHECK(selected(resolver) == BackendKind::LegacyRoot);
}

TEST_CASE("concurrent first resolution instantiates a single backend") {
    Signals s;
    BackendSlot slot;
    auto env = s.environment(pie());

    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            CapabilityResolver resolver(env, slot);
            if (resolver.resolve(BackendSupport::all())) ++successes;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(successes == 8);
    CHECK(s.created == 1);
}

TEST_CASE("is_root_available scans the search path for an executable su") {
    TempDir tmp;
    write_text(tmp.file("bin/su"), "#!/bin/sh\n");
    write_text(tmp.file("noexec/su"), "#!/bin/sh\n");
    chmod(tmp.file("bin/su").c_str(), 0755);
    chmod(tmp.file("noexec/su").c_str(), 0644);

    CHECK(is_root_available(tmp.file("empty") + ":" + tmp.file("bin")));
    CHECK_FALSE(is_root_available(tmp.file("noexec")));
    CHECK_FALSE(is_root_available(""));
    CHECK_FALSE(is_root_available("::"));
}

TEST_CASE("backend kinds round-trip through their names") {
    for (auto kind : {BackendKind::VendorCompanion, BackendKind::Companion, BackendKind::SystemService,
                      BackendKind::Root, BackendKind::LegacyRoot, BackendKind::CompanionApp}) {
        CHECK(parse_backend_kind(backend_kind_to_string(kind)) == kind);
    }
    CHECK_FALSE(parse_backend_kind("magisk").has_value());
}

TEST_CASE("host environment reads signals from the filesystem") {
    TempDir tmp;
    write_text(tmp.file("bridge"), "");
    write_text(tmp.file("bin/su"), "#!/bin/sh\n");
    chmod(tmp.file("bin/su").c_str(), 0755);

    EnvironmentConfig config;
    config.platform = pie();
    config.companion_socket = tmp.file("missing.sock");
    config.system_service_path = tmp.file("bridge");
    config.companion_app_path = tmp.file("no-app");
    config.granted_permissions = {COMPANION_ACCESS_PERMISSION};
    config.search_path = tmp.file("bin");

    auto env = make_host_environment(config);
    CHECK_FALSE(env.companion_service_reachable());
    CHECK_FALSE(env.companion_service_initialize());
    CHECK(env.system_service_bridge_present());
    CHECK(env.root_available());
    CHECK_FALSE(env.companion_app_installed());
    CHECK(env.permission_granted(COMPANION_ACCESS_PERMISSION));
    CHECK_FALSE(env.permission_granted(OVERLAY_PERMISSION));

    BackendSlot slot;
    CapabilityResolver resolver(env, slot);
    CHECK(resolver.resolve(BackendSupport::all()));
    CHECK(selected(resolver) == BackendKind::SystemService);
}

TEST_CASE("backend support flags map one to one onto kinds") {
    const BackendKind kinds[] = {BackendKind::VendorCompanion, BackendKind::Companion,
                                 BackendKind::SystemService, BackendKind::Root,
                                 BackendKind::LegacyRoot, BackendKind::CompanionApp};
    for (auto kind : kinds) {
        BackendSupport support;
        support.enable(kind);
        for (auto other : kinds) {
            CHECK(support.enabled(other) == (other == kind));
        }
        support.enable(kind, false);
        CHECK_FALSE(support.enabled(kind));
    }
}

TEST_CASE("vendor names round-trip") {
    CHECK(parse_vendor(vendor_to_string(Vendor::Samsung)) == Vendor::Samsung);
    CHECK(parse_vendor(vendor_to_string(Vendor::Generic)) == Vendor::Generic);
}
