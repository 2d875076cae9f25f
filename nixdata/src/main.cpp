// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "nixdata/core/output.hpp"
#include "nixdata/version.hpp"

#include "common_options.hpp"

using namespace nixdata;  // NOLINT(build/namespaces)

int
main(int argc, char** argv)
{
    init_logging(LoggingParams{});

    GeneralOptions options;
    CLI::App app{ "Cache and query the Nix package indexes\nVersion: " + version() + "\n" };
    init_general_options(&app, options);
    app.set_version_flag("--version", version());
    app.require_subcommand(1);

    set_store_command(
        app.add_subcommand("store", "Make sure a package store is fresh and print its path"),
        options
    );
    set_options_command(
        app.add_subcommand("options", "Make sure the NixOS options document is fresh and print its path"),
        options
    );
    set_resolve_command(
        app.add_subcommand("resolve", "Print the versions of the packages declared in Nix files"),
        options
    );

    std::optional<std::string> error_to_report;
    try
    {
        CLI11_PARSE(app, argc, argv);
    }
    catch (const std::exception& e)
    {
        error_to_report = e.what();
    }

    if (error_to_report)
    {
        LOG_ERROR << error_to_report.value();
        return 1;
    }

    return 0;
}
