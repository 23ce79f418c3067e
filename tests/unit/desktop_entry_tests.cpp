#include <doctest/doctest.h>
#include <appdesk/desktop_entry.hpp>
#include <appdesk/platform.hpp>

#include "test_helpers.hpp"

using namespace appdesk;
using appdesk::test::TempTestDir;
using appdesk::test::make_config;
using appdesk::test::read_text;
using appdesk::test::write_text;

TEST_CASE("render_desktop_entry with icon") {
    DesktopEntry entry;
    entry.name = "Foo";
    entry.exec_path = "/home/u/apps/Foo-1.2.AppImage";
    entry.icon = "Foo-1.2";

    CHECK(render_desktop_entry(entry) ==
          "[Desktop Entry]\n"
          "Name=Foo\n"
          "Exec=\"/home/u/apps/Foo-1.2.AppImage\" %U\n"
          "Icon=Foo-1.2\n"
          "Terminal=false\n"
          "Type=Application\n"
          "Categories=Utility;\n"
          "StartupNotify=true\n");
}

TEST_CASE("render_desktop_entry without icon emits a placeholder comment") {
    DesktopEntry entry;
    entry.name = "Bar";
    entry.exec_path = "/opt/Bar.AppImage";

    std::string text = render_desktop_entry(entry);
    CHECK(text.find("# Icon= (no icon found)\n") != std::string::npos);
    CHECK(text.find("\nIcon=") == std::string::npos);
}

TEST_CASE("escape_exec_argument leaves ordinary paths alone") {
    CHECK(escape_exec_argument("/home/u/apps/Foo-1.2.AppImage") == "/home/u/apps/Foo-1.2.AppImage");
    CHECK(escape_exec_argument("/home/u/My Apps/Foo.AppImage") == "/home/u/My Apps/Foo.AppImage");
    CHECK(escape_exec_argument("").empty());
}

TEST_CASE("escape_exec_argument quotes reserved characters") {
    CHECK(escape_exec_argument("a\"b") == R"(a\\"b)");
    CHECK(escape_exec_argument("a$b") == R"(a\\$b)");
    CHECK(escape_exec_argument("a`b") == R"(a\\`b)");
    CHECK(escape_exec_argument(R"(a\b)") == R"(a\\\\b)");
    CHECK(escape_exec_argument("100%") == "100%%");
}

TEST_CASE("render_desktop_entry escapes the Exec path") {
    DesktopEntry entry;
    entry.name = "Cost";
    entry.exec_path = "/opt/$HOME/Cost \"v2\".AppImage";

    std::string text = render_desktop_entry(entry);
    CHECK(text.find(R"(Exec="/opt/\\$HOME/Cost \\"v2\\".AppImage" %U)" "\n") != std::string::npos);
}

TEST_CASE("find_icon probes png, svg, jpg, jpeg in order") {
    TempTestDir temp;
    std::string bundle = temp.file("Foo-1.2.AppImage");
    write_text(bundle, "x");

    CHECK_FALSE(find_icon(bundle).has_value());

    write_text(temp.file("Foo-1.2.jpeg"), "jpeg");
    CHECK(find_icon(bundle) == std::optional<std::string>(temp.file("Foo-1.2.jpeg")));

    write_text(temp.file("Foo-1.2.jpg"), "jpg");
    CHECK(find_icon(bundle) == std::optional<std::string>(temp.file("Foo-1.2.jpg")));

    write_text(temp.file("Foo-1.2.svg"), "svg");
    CHECK(find_icon(bundle) == std::optional<std::string>(temp.file("Foo-1.2.svg")));

    write_text(temp.file("Foo-1.2.png"), "png");
    CHECK(find_icon(bundle) == std::optional<std::string>(temp.file("Foo-1.2.png")));
}

TEST_CASE("find_icon matches the full base name, not the identifier") {
    TempTestDir temp;
    std::string bundle = temp.file("Foo-1.2.AppImage");
    write_text(bundle, "x");
    write_text(temp.file("Foo.png"), "png");

    CHECK_FALSE(find_icon(bundle).has_value());
}

TEST_CASE("DescriptorWriter writes the descriptor without icon") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    std::string bundle = config.bundle_dir + "/Foo-1.2.AppImage";
    write_text(bundle, "x");

    DescriptorStore store(config);
    DescriptorWriter writer(config, store);

    auto r = writer.write(bundle);
    REQUIRE(r.isOk());
    CHECK(r.value().identifier == "Foo");
    CHECK(r.value().descriptor_path == config.descriptor_dir + "/appimage-Foo.desktop");
    CHECK_FALSE(r.value().icon_path.has_value());

    std::string text = read_text(r.value().descriptor_path);
    CHECK(text.find("Name=Foo\n") != std::string::npos);
    CHECK(text.find("Exec=\"" + bundle + "\" %U\n") != std::string::npos);
    CHECK(text.find("# Icon= (no icon found)") != std::string::npos);
    CHECK_FALSE(path_exists(config.icon_dir));
}

TEST_CASE("DescriptorWriter copies a colocated icon") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    std::string bundle = config.bundle_dir + "/Foo-1.2.AppImage";
    write_text(bundle, "x");
    write_text(config.bundle_dir + "/Foo-1.2.svg", "<svg/>");

    DescriptorStore store(config);
    DescriptorWriter writer(config, store);

    auto r = writer.write(bundle);
    REQUIRE(r.isOk());
    REQUIRE(r.value().icon_path.has_value());
    CHECK(*r.value().icon_path == config.icon_dir + "/Foo-1.2.svg");
    CHECK(read_text(config.icon_dir + "/Foo-1.2.svg") == "<svg/>");
    // Copied, not moved
    CHECK(path_exists(config.bundle_dir + "/Foo-1.2.svg"));

    std::string text = read_text(r.value().descriptor_path);
    CHECK(text.find("Icon=Foo-1.2\n") != std::string::npos);
}

TEST_CASE("DescriptorWriter output is byte-identical across runs") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    std::string bundle = config.bundle_dir + "/Foo-1.2.AppImage";
    write_text(bundle, "x");
    write_text(config.bundle_dir + "/Foo-1.2.png", "png");

    DescriptorStore store(config);
    DescriptorWriter writer(config, store);

    auto first = writer.write(bundle);
    REQUIRE(first.isOk());
    std::string first_text = read_text(first.value().descriptor_path);

    auto second = writer.write(bundle);
    REQUIRE(second.isOk());
    CHECK(read_text(second.value().descriptor_path) == first_text);
}

TEST_CASE("later bundle with the same identifier overwrites the descriptor") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    write_text(config.bundle_dir + "/Foo-1.AppImage", "x");
    write_text(config.bundle_dir + "/Foo_2.AppImage", "x");

    DescriptorStore store(config);
    DescriptorWriter writer(config, store);

    REQUIRE(writer.write(config.bundle_dir + "/Foo-1.AppImage").isOk());
    REQUIRE(writer.write(config.bundle_dir + "/Foo_2.AppImage").isOk());

    CHECK(store.identifiers() == std::vector<std::string>{"Foo"});
    std::string text = read_text(store.path_for("Foo"));
    CHECK(text.find("Foo_2.AppImage") != std::string::npos);
}

TEST_CASE("DescriptorWriter reports icon copy failure") {
    TempTestDir temp;
    Config config = make_config(temp.path);
    std::string bundle = config.bundle_dir + "/Foo.AppImage";
    write_text(bundle, "x");
    write_text(config.bundle_dir + "/Foo.png", "png");
    // A regular file blocks the icon directory
    write_text(config.icon_dir, "blocker");

    DescriptorStore store(config);
    DescriptorWriter writer(config, store);

    auto r = writer.write(bundle);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::IO_ERROR);
    CHECK_FALSE(path_exists(store.path_for("Foo")));
}
