// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "nixdata/core/output.hpp"

#include "common_options.hpp"

using namespace nixdata;  // NOLINT(build/namespaces)

void
init_general_options(CLI::App* app, GeneralOptions& options)
{
    app->add_option("--config", options.config_file, "Path to a YAML configuration file")
        ->option_text("FILE");
    app->add_option("--cache-dir", options.cache_dir, "Directory holding the cache artifacts")
        ->option_text("DIR");
    app->add_flag(
        "-v,--verbose",
        options.verbosity,
        "Set verbosity (higher verbosity with multiple -v, e.g. -vvv)"
    );
}

Context
load_command_context(const GeneralOptions& options)
{
    Context ctx = extract(load_context(options.config_file));
    if (!options.cache_dir.empty())
    {
        ctx.cache_params.cache_dir = options.cache_dir;
    }
    if (options.verbosity > 0)
    {
        const int level = std::max(
            static_cast<int>(log_level::trace),
            static_cast<int>(ctx.logging_params.level) - options.verbosity
        );
        ctx.logging_params.level = static_cast<log_level>(level);
    }
    init_logging(ctx.logging_params);
    return ctx;
}
