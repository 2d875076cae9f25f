// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nixdata/api/resolve.hpp"
#include "nixdata/core/output.hpp"

#include "common_options.hpp"

using namespace nixdata;  // NOLINT(build/namespaces)

namespace
{
    const std::map<std::string, SourceSelector> selector_names = {
        { "system", SourceSelector::system },
        { "legacy", SourceSelector::legacy },
        { "flake", SourceSelector::flake },
    };

    // Owned by the parsers, which outlive the callbacks
    SourceSelector store_selector = SourceSelector::system;
    SourceSelector resolve_selector = SourceSelector::system;
    std::vector<std::string> declaration_files;
}

void
set_store_command(CLI::App* subcom, GeneralOptions& options)
{
    subcom->add_option("source", store_selector, "Package index to cache")
        ->required()
        ->transform(CLI::CheckedTransformer(selector_names));

    subcom->callback(
        [&options]
        {
            const auto ctx = load_command_context(options);
            const auto path = extract(ensure_store(ctx, store_selector));
            std::cout << path.string() << std::endl;
        }
    );
}

void
set_options_command(CLI::App* subcom, GeneralOptions& options)
{
    subcom->callback(
        [&options]
        {
            const auto ctx = load_command_context(options);
            const auto path = extract(ensure_document(ctx));
            std::cout << path.string() << std::endl;
        }
    );
}

void
set_resolve_command(CLI::App* subcom, GeneralOptions& options)
{
    subcom->add_option("source", resolve_selector, "Package index to query")
        ->required()
        ->transform(CLI::CheckedTransformer(selector_names));
    subcom->add_option("files", declaration_files, "Nix files declaring the system packages")
        ->required()
        ->option_text("FILE...");

    subcom->callback(
        [&options]
        {
            const auto ctx = load_command_context(options);
            const std::vector<fs::path> paths(declaration_files.begin(), declaration_files.end());
            const auto versions = extract(resolve_versions(ctx, resolve_selector, paths));
            std::cout << nlohmann::json(versions).dump(4) << std::endl;
        }
    );
}
