#include <doctest/doctest.h>
#include <rro/compile.hpp>
#include <rro/overlay_spec.hpp>
#include <rro/preferences.hpp>

#include "test_support.hpp"

using namespace rro;
using namespace rro::test;

namespace {

OverlaySpec make_spec(const TempDir& tmp) {
    return OverlaySpecBuilder("com.example.overlay", "com.android.systemui", 1700000000000LL)
        .output_dir(tmp.file("out"))
        .add_resource_dir(tmp.file("res"))
        .build();
}

} // namespace

TEST_CASE("overlay_artifacts lays out intermediates next to the final archive") {
    auto a = overlay_artifacts("/data/out", "com.example.overlay");
    CHECK(a.unsigned_apk == "/data/out/com.example.overlay-unsigned.apk");
    CHECK(a.aligned_apk == "/data/out/com.example.overlay-unsigned-aligned.apk");
    CHECK(a.signed_apk == "/data/out/com.example.overlay.apk");
}

TEST_CASE("build_compile_args orders manifest, sources, includes and output") {
    TempDir tmp;
    write_text(tmp.file("base.apk"), "base");

    auto spec = OverlaySpecBuilder("com.example.overlay", "com.android.systemui", 1)
        .add_resource_dir("/res/a")
        .add_resource_dir("/res/b")
        .set_asset_dir("/assets")
        .add_extra_base_package(tmp.file("base.apk"))
        .build();

    auto args = build_compile_args(spec, "/work/AndroidManifest.xml", "/out/x-unsigned.apk",
                                   "/system/framework/framework-res.apk", false);

    std::vector<std::string> expected = {
        "p",
        "-M", "/work/AndroidManifest.xml",
        "-S", "/res/a",
        "-S", "/res/b",
        "-A", "/assets",
        "-I", "/system/framework/framework-res.apk",
        "-I", tmp.file("base.apk"),
        "-F", "/out/x-unsigned.apk",
        "--auto-add-overlay",
        "-f",
    };
    CHECK(args == expected);
}

TEST_CASE("build_compile_args skips missing base packages") {
    TempDir tmp;
    write_text(tmp.file("present.apk"), "base");

    auto spec = OverlaySpecBuilder("com.example.overlay", "com.android.systemui", 1)
        .add_resource_dir("/res")
        .add_extra_base_package(tmp.file("missing.apk"))
        .add_extra_base_package(tmp.file("present.apk"))
        .build();

    auto includes = args_after(build_compile_args(spec, "m", "u", "/fw.apk", false), "-I");
    REQUIRE(includes.size() == 2);
    CHECK(includes[0] == "/fw.apk");
    CHECK(includes[1] == tmp.file("present.apk"));
}

TEST_CASE("build_compile_args drops base packages in legacy mode") {
    TempDir tmp;
    write_text(tmp.file("present.apk"), "base");

    auto spec = OverlaySpecBuilder("com.example.overlay", "com.android.systemui", 1)
        .add_resource_dir("/res")
        .add_extra_base_package(tmp.file("present.apk"))
        .build();

    auto includes = args_after(build_compile_args(spec, "m", "u", "/fw.apk", true), "-I");
    REQUIRE(includes.size() == 1);
    CHECK(includes[0] == "/fw.apk");
}

TEST_CASE("compile_overlay fails fast on empty resource directories") {
    TempDir tmp;
    auto spec = OverlaySpecBuilder("com.example.overlay", "com.android.systemui", 1)
        .output_dir(tmp.file("out"))
        .build();

    FakeToolInvoker tools;
    MapPreferences prefs;
    auto result = compile_overlay(spec, tmp.path(), tools, fake_toolchain(), prefs);

    REQUIRE(std::holds_alternative<Failure>(result));
    CHECK(std::get<Failure>(result).message == "Resource directory cannot be empty!");
    CHECK(tools.calls.empty());
}

TEST_CASE("compile_overlay fails when the output directory cannot be created") {
    TempDir tmp;
    write_text(tmp.file("blocker"), "not a directory");

    auto spec = OverlaySpecBuilder("com.example.overlay", "com.android.systemui", 1)
        .output_dir(tmp.file("blocker/out"))
        .add_resource_dir(tmp.file("res"))
        .build();

    FakeToolInvoker tools;
    MapPreferences prefs;
    auto result = compile_overlay(spec, tmp.path(), tools, fake_toolchain(), prefs);

    REQUIRE(std::holds_alternative<Failure>(result));
    CHECK(std::get<Failure>(result).message == "Failed to create overlay cache directory");
    CHECK(tools.calls.empty());
}

TEST_CASE("compile_overlay creates the output directory and returns the unsigned archive") {
    TempDir tmp;
    auto spec = make_spec(tmp);

    FakeToolInvoker tools;
    MapPreferences prefs;
    auto result = compile_overlay(spec, tmp.file("work"), tools, fake_toolchain(), prefs);

    REQUIRE(std::holds_alternative<Success>(result));
    CHECK(std::get<Success>(result).path == tmp.file("out/com.example.overlay-unsigned.apk"));
    CHECK(is_directory(tmp.file("out")));
    CHECK(tools.count(FAKE_AAPT) == 1);
    CHECK(arg_after(tools.calls[0].args, "-M") == tmp.file("work/AndroidManifest.xml"));
}

TEST_CASE("compile_overlay reports compiler errors verbatim") {
    TempDir tmp;
    auto spec = make_spec(tmp);

    FakeToolInvoker tools;
    tools.compiler_stderr = {{"res/values/colors.xml:3: error: Error parsing XML",
                              "res/values/colors.xml:4: error: unbound prefix"}};
    MapPreferences prefs;
    auto result = compile_overlay(spec, tmp.path(), tools, fake_toolchain(), prefs);

    REQUIRE(std::holds_alternative<Failure>(result));
    CHECK(std::get<Failure>(result).message ==
          "res/values/colors.xml:3: error: Error parsing XML\n"
          "res/values/colors.xml:4: error: unbound prefix");
    CHECK(tools.count(FAKE_AAPT) == 1);
}

TEST_CASE("compile_overlay retries once in legacy mode on incompatible resource types") {
    TempDir tmp;
    write_text(tmp.file("SystemUI.apk"), "base");
    auto spec = OverlaySpecBuilder("com.example.overlay", "com.android.systemui", 1)
        .output_dir(tmp.file("out"))
        .add_resource_dir(tmp.file("res"))
        .add_extra_base_package(tmp.file("SystemUI.apk"))
        .build();

    FakeToolInvoker tools;
    tools.compiler_stderr = {
        {"ERROR: Resource entry drawable/x has conflicting types not allowed in this mode"},
        {},
    };
    MapPreferences prefs;
    auto result = compile_overlay(spec, tmp.path(), tools, fake_toolchain(), prefs);

    REQUIRE(std::holds_alternative<Success>(result));
    REQUIRE(tools.count(FAKE_AAPT) == 2);

    auto first = args_after(tools.nth(FAKE_AAPT, 0)->args, "-I");
    auto second = args_after(tools.nth(FAKE_AAPT, 1)->args, "-I");
    CHECK(first.size() == 2);
    REQUIRE(second.size() == 1);
    CHECK(second[0] == "/system/framework/framework-res.apk");
}

TEST_CASE("compile_overlay runs the compiler at most twice when legacy mode also fails") {
    TempDir tmp;
    auto spec = make_spec(tmp);

    FakeToolInvoker tools;
    tools.compiler_stderr = {{"drawable types not allowed"}};
    MapPreferences prefs;
    auto result = compile_overlay(spec, tmp.path(), tools, fake_toolchain(), prefs);

    CHECK(tools.count(FAKE_AAPT) == 2);
    REQUIRE(std::holds_alternative<Failure>(result));
    CHECK(std::get<Failure>(result).message == "drawable types not allowed");
}

TEST_CASE("compile_overlay never falls back when force_new_compiler is set") {
    TempDir tmp;
    auto spec = make_spec(tmp);

    FakeToolInvoker tools;
    tools.compiler_stderr = {{"drawable types not allowed"}};
    MapPreferences prefs;
    prefs.set_boolean(PREF_FORCE_NEW_COMPILER, true);
    auto result = compile_overlay(spec, tmp.path(), tools, fake_toolchain(), prefs);

    CHECK(tools.count(FAKE_AAPT) == 1);
    REQUIRE(std::holds_alternative<Failure>(result));
    CHECK(std::get<Failure>(result).message == "drawable types not allowed");
}

TEST_CASE("compile_overlay fails when the compiler leaves no archive") {
    TempDir tmp;
    auto spec = make_spec(tmp);

    FakeToolInvoker tools;
    tools.compiler_writes_output = false;
    MapPreferences prefs;
    auto result = compile_overlay(spec, tmp.path(), tools, fake_toolchain(), prefs);

    REQUIRE(std::holds_alternative<Failure>(result));
    CHECK(std::get<Failure>(result).message == "Failed to compile overlay");
}

TEST_CASE("compile_overlay does not accept an archive left by an earlier run") {
    TempDir tmp;
    auto spec = make_spec(tmp);
    write_text(tmp.file("out/com.example.overlay-unsigned.apk"), "stale");

    MapPreferences prefs;

    SUBCASE("compiler writes nothing") {
        FakeToolInvoker tools;
        tools.compiler_writes_output = false;
        auto result = compile_overlay(spec, tmp.path(), tools, fake_toolchain(), prefs);

        REQUIRE(std::holds_alternative<Failure>(result));
        CHECK(std::get<Failure>(result).message == "Failed to compile overlay");
        CHECK_FALSE(path_exists(tmp.file("out/com.example.overlay-unsigned.apk")));
    }

    SUBCASE("compiler cannot be started") {
        ProcessToolInvoker tools;
        auto toolchain = fake_toolchain();
        toolchain.aapt = tmp.file("no-such-aapt");
        auto result = compile_overlay(spec, tmp.path(), tools, toolchain, prefs);

        REQUIRE(std::holds_alternative<Failure>(result));
        CHECK(std::get<Failure>(result).message == "Failed to compile overlay");
    }

    SUBCASE("compiler replaces it") {
        FakeToolInvoker tools;
        auto result = compile_overlay(spec, tmp.path(), tools, fake_toolchain(), prefs);

        REQUIRE(std::holds_alternative<Success>(result));
        CHECK(read_text(std::get<Success>(result).path) == "unsigned");
    }
}
