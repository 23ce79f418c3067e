/**
 * appdesk CLI - Entry Point
 *
 * Makes AppImages executable and keeps their desktop entries in sync.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#include <iostream>

int main(int argc, char** argv) {
    using namespace appdesk;
    using namespace appdesk::cli;

    CLI::App app{"appdesk - AppImage desktop integration"};
    app.set_version_flag("-V,--version", APPDESK_VERSION);
    app.set_help_flag();
    app.footer(usage_footer());

    GlobalOptions opts;
    Invocation invocation;
    std::string show_name;
    std::string remove_name;

    app.add_flag("-h,--help", invocation.help, "Show this help message and exit");
    app.add_option("-s,--show-desktop", show_name, "Show the .desktop file for the given short name");
    app.add_flag("-i,--install-libfuse2", invocation.install_package,
                 "Install libfuse2 if it isn't already");
    app.add_flag("-c,--create-desktop", invocation.create,
                 "Create/update .desktop files (default if AppImages are given)");
    app.add_flag("-l,--list", invocation.list,
                 "List AppImages and show which have a .desktop file");
    app.add_option("-r,--remove-desktop", remove_name, "Remove the .desktop file for a short name");
    app.add_option("bundles", invocation.bundles, "AppImage paths, globs or short names");

    app.add_flag("--json", invocation.json, "Machine-readable output");
    app.add_flag("-q,--quiet", invocation.quiet, "Minimal output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_option("--config", opts.config_file, "Configuration file (JSON)");
    app.add_option("--apps-dir", opts.apps_dir, "Directory holding AppImages");
    app.add_option("--desktop-dir", opts.desktop_dir, "Directory for .desktop files");
    app.add_option("--icon-dir", opts.icon_dir, "Directory for copied icons");
    app.add_option("--prefix", opts.prefix, "Prefix of managed .desktop filenames");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Usage errors exit 2 before anything touches the filesystem
        int rc = app.exit(e);
        return rc == 0 ? 0 : 2;
    }

    init_logging(opts.verbose);

    if (app.count("--show-desktop") > 0) {
        invocation.show_name = show_name;
    }
    if (app.count("--remove-desktop") > 0) {
        invocation.remove_name = remove_name;
    }

    auto config = resolve_config(to_overrides(opts), get_env);
    if (config.isErr()) {
        spdlog::debug("Configuration rejected ({})", error_code_to_string(config.error().code()));
        print_error(config.error().message(), invocation.json);
        return 1;
    }

    AptPackageManager packages;
    DesktopDatabase launcher;
    RunContext ctx{config.value(), packages, launcher, std::cout, std::cerr, app.help()};

    auto result = dispatch(invocation, ctx);
    return result.exit_code;
}
