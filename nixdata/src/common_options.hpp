// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CLI_COMMON_OPTIONS_HPP
#define NIXDATA_CLI_COMMON_OPTIONS_HPP

#include <string>

#include <CLI/CLI.hpp>

#include "nixdata/core/context.hpp"

struct GeneralOptions
{
    std::string config_file;
    std::string cache_dir;
    int verbosity = 0;
};

void init_general_options(CLI::App* app, GeneralOptions& options);

// Configuration file, then environment, then command line options.
// Throws nixdata_error if the configuration is invalid.
nixdata::Context load_command_context(const GeneralOptions& options);

void set_store_command(CLI::App* subcom, GeneralOptions& options);

void set_options_command(CLI::App* subcom, GeneralOptions& options);

void set_resolve_command(CLI::App* subcom, GeneralOptions& options);

#endif
