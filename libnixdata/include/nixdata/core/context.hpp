// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_CONTEXT_HPP
#define NIXDATA_CORE_CONTEXT_HPP

#include <chrono>
#include <string>
#include <vector>

#include "nixdata/core/error_handling.hpp"
#include "nixdata/core/output.hpp"
#include "nixdata/download/parameters.hpp"
#include "nixdata/fs/filesystem.hpp"
#include "nixdata/version.hpp"

namespace nixdata
{
    struct CacheParams
    {
        fs::path cache_dir;
        std::chrono::seconds lock_timeout{ 30 };
    };

    struct SystemParams
    {
        std::vector<std::string> release_command{ "nixos-version" };
        // Release that tracks the unstable channel
        std::string rolling_release{ "22.11" };
        std::string channels_url{ "https://channels.nixos.org" };
    };

    enum class BulkLoaderKind
    {
        in_process,
        sqlite3
    };

    struct BulkLoadParams
    {
        BulkLoaderKind loader = BulkLoaderKind::in_process;
        std::string sqlite3_executable{ "sqlite3" };
    };

    // Configuration of every component, passed explicitly to their constructors.
    class Context
    {
    public:

        Context();

        CacheParams cache_params;
        SystemParams system_params;
        BulkLoadParams bulk_load_params;
        LoggingParams logging_params;

        download::RemoteFetchParams remote_fetch_params = {
            .ssl_verify = { "" },
            .user_agent = { "nix-data/" NIXDATA_VERSION_STRING },
            .connect_timeout_secs = 10.,
            .transfer_timeout_secs = 300,
            .proxy = {},
        };

        // Default cache location, ``<user cache dir>/nix-data``
        static fs::path default_cache_dir();
    };

    /**
     * Load a context from a YAML configuration file, then apply environment overrides.
     *
     * An empty path skips the file and only applies the environment.
     */
    [[nodiscard]] auto load_context(const fs::path& config_file) -> expected_t<Context>;

    /**
     * Apply ``NIXDATA_CACHE_DIR`` and ``NIXDATA_LOG_LEVEL`` to the context.
     */
    void apply_env_overrides(Context& ctx);
}

#endif
