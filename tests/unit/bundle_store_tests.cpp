#include <doctest/doctest.h>
#include <appdesk/bundle_store.hpp>
#include <appdesk/platform.hpp>

#include "test_helpers.hpp"

#include <algorithm>

using namespace appdesk;
using appdesk::test::TempTestDir;
using appdesk::test::make_config;
using appdesk::test::write_text;

namespace {

std::vector<std::string> filenames(const std::vector<Bundle>& bundles) {
    std::vector<std::string> names;
    for (const auto& b : bundles) names.push_back(b.filename);
    return names;
}

} // namespace

TEST_CASE("case-insensitive suffix helper") {
    CHECK(ends_with_ignore_case("Foo.appimage", ".AppImage"));
    CHECK(ends_with_ignore_case("Foo.APPIMAGE", ".AppImage"));
    CHECK_FALSE(ends_with_ignore_case("Foo.AppImage.zip", ".AppImage"));
    CHECK_FALSE(ends_with_ignore_case("x", ".AppImage"));
}

TEST_CASE("Bundle computes names from its filename") {
    Bundle b = make_bundle("/home/u/apps/Foo-1.2.AppImage");
    CHECK(b.filename == "Foo-1.2.AppImage");
    CHECK(b.full_base_name() == "Foo-1.2");
    CHECK(b.identifier() == "Foo");
}

TEST_CASE("enumerate lists bundle files sorted by filename") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    write_text(config.bundle_dir + "/Zed-1.AppImage", "z");
    write_text(config.bundle_dir + "/Alpha-2.appimage", "a");
    write_text(config.bundle_dir + "/Mid.APPIMAGE", "m");
    write_text(config.bundle_dir + "/notes.txt", "n");
    write_text(config.bundle_dir + "/Alpha-2.png", "icon");
    std::filesystem::create_directories(config.bundle_dir + "/Dir.AppImage");
    write_text(config.bundle_dir + "/nested/Deep.AppImage", "d");

    BundleStore store(config);
    auto bundles = store.enumerate();

    CHECK(filenames(bundles) == std::vector<std::string>{"Alpha-2.appimage", "Mid.APPIMAGE", "Zed-1.AppImage"});
    for (const auto& b : bundles) {
        CHECK(b.path.front() == '/');
    }
}

TEST_CASE("enumerate order is stable across calls") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    for (const char* name : {"c.AppImage", "a.AppImage", "B.AppImage", "b.AppImage", "a-1.AppImage"}) {
        write_text(config.bundle_dir + "/" + name, "x");
    }

    BundleStore store(config);
    auto first = filenames(store.enumerate());
    CHECK(std::is_sorted(first.begin(), first.end()));
    for (int i = 0; i < 3; ++i) {
        CHECK(filenames(store.enumerate()) == first);
    }
}

TEST_CASE("enumerate on a missing directory is empty") {
    TempTestDir temp;
    Config config = make_config(temp.path + "/does-not-exist");
    BundleStore store(config);
    CHECK(store.enumerate().empty());
    CHECK(store.resolve("Foo").empty());
}

TEST_CASE("resolve treats plain tokens as short-name prefixes") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    write_text(config.bundle_dir + "/Foo-1.2.AppImage", "x");
    write_text(config.bundle_dir + "/FooBar-3.AppImage", "x");
    write_text(config.bundle_dir + "/Bar-9.AppImage", "x");
    write_text(config.bundle_dir + "/Foo.png", "x");

    BundleStore store(config);

    CHECK(filenames(store.resolve("Foo")) == std::vector<std::string>{"Foo-1.2.AppImage", "FooBar-3.AppImage"});
    CHECK(filenames(store.resolve("foo")) == std::vector<std::string>{"Foo-1.2.AppImage", "FooBar-3.AppImage"});
    CHECK(filenames(store.resolve("bar")) == std::vector<std::string>{"Bar-9.AppImage"});
    CHECK(store.resolve("Nope").empty());
    CHECK(store.resolve("").empty());
}

TEST_CASE("resolve lets short-name tokens carry glob characters") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    write_text(config.bundle_dir + "/Foo-1.2.AppImage", "x");
    write_text(config.bundle_dir + "/FooBar-3.AppImage", "x");
    write_text(config.bundle_dir + "/Bar-9.AppImage", "x");

    BundleStore store(config);

    CHECK(filenames(store.resolve("F*3")) == std::vector<std::string>{"FooBar-3.AppImage"});
    CHECK(filenames(store.resolve("f?o-")) == std::vector<std::string>{"Foo-1.2.AppImage"});
    CHECK(filenames(store.resolve("*-9")) == std::vector<std::string>{"Bar-9.AppImage"});
    CHECK(filenames(store.resolve("[BF]oo")) == std::vector<std::string>{"Foo-1.2.AppImage", "FooBar-3.AppImage"});
}

TEST_CASE("resolve treats slashes and the bundle extension as paths") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    BundleStore store(config);

    CHECK(store.is_path_token("./Foo"));
    CHECK(store.is_path_token("Foo.AppImage"));
    CHECK(store.is_path_token("foo.appimage"));
    CHECK_FALSE(store.is_path_token("Foo"));

    SUBCASE("literal path is returned as given") {
        auto r = store.resolve("/somewhere/else/Tool-1.AppImage");
        REQUIRE(r.size() == 1);
        CHECK(r[0].path == "/somewhere/else/Tool-1.AppImage");
        CHECK(r[0].identifier() == "Tool");
    }

    SUBCASE("glob expands to matching files") {
        write_text(config.bundle_dir + "/A-1.AppImage", "x");
        write_text(config.bundle_dir + "/B-1.AppImage", "x");
        write_text(config.bundle_dir + "/C.txt", "x");
        auto r = store.resolve(config.bundle_dir + "/*.AppImage");
        CHECK(filenames(r) == std::vector<std::string>{"A-1.AppImage", "B-1.AppImage"});
    }

    SUBCASE("glob without matches stays literal") {
        std::string pattern = config.bundle_dir + "/*.AppImage";
        auto r = store.resolve(pattern);
        REQUIRE(r.size() == 1);
        CHECK(r[0].path == pattern);
        CHECK_FALSE(store.exists(r[0]));
    }
}

TEST_CASE("exists reports vanished bundles") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    write_text(config.bundle_dir + "/Foo.AppImage", "x");

    BundleStore store(config);
    auto bundles = store.enumerate();
    REQUIRE(bundles.size() == 1);
    CHECK(store.exists(bundles[0]));

    std::filesystem::remove(bundles[0].path);
    CHECK_FALSE(store.exists(bundles[0]));
}

TEST_CASE("make_executable adds execute permission") {
    TempTestDir temp;
    std::string path = temp.file("Tool.AppImage");
    write_text(path, "x");
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    CHECK_FALSE(is_executable(path));
    CHECK(make_executable(path));
    CHECK(is_executable(path));
}

TEST_CASE("list_directory reports entry names and never throws") {
    TempTestDir temp;
    write_text(temp.file("a.AppImage"), "x");
    write_text(temp.file("sub/b.AppImage"), "x");

    auto names = list_directory(temp.path);
    std::sort(names.begin(), names.end());
    CHECK(names == std::vector<std::string>{"a.AppImage", "sub"});

    CHECK(list_directory(temp.file("missing")).empty());
    CHECK(list_directory(temp.file("a.AppImage")).empty());
}

TEST_CASE("read_file only reads regular files") {
    TempTestDir temp;
    write_text(temp.file("empty"), "");
    write_text(temp.file("text"), "hello");

    CHECK(read_file(temp.file("empty")) == std::optional<std::string>(""));
    CHECK(read_file(temp.file("text")) == std::optional<std::string>("hello"));
    CHECK_FALSE(read_file(temp.path).has_value());
    CHECK_FALSE(read_file(temp.file("missing")).has_value());
}
