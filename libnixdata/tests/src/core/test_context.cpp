// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "nixdata/core/context.hpp"

#include "nixdatatests.hpp"

using namespace nixdata;

namespace
{
    TEST_CASE("Context defaults", "[nixdata::core]")
    {
        const auto restore = nixdatatests::EnvironmentCleaner("XDG_CACHE_HOME");
        util::set_env("XDG_CACHE_HOME", "/tmp/xdg");

        const auto ctx = Context();
        REQUIRE(ctx.cache_params.cache_dir == fs::path("/tmp/xdg/nix-data"));
        REQUIRE(ctx.cache_params.lock_timeout == std::chrono::seconds(30));
        REQUIRE(ctx.system_params.release_command == std::vector<std::string>{ "nixos-version" });
        REQUIRE(ctx.system_params.rolling_release == "22.11");
        REQUIRE(ctx.system_params.channels_url == "https://channels.nixos.org");
        REQUIRE(ctx.bulk_load_params.loader == BulkLoaderKind::in_process);
        REQUIRE(ctx.logging_params.level == log_level::warn);
        REQUIRE(ctx.remote_fetch_params.connect_timeout_secs == 10.);
        REQUIRE(ctx.remote_fetch_params.transfer_timeout_secs == 300);
        REQUIRE(ctx.remote_fetch_params.user_agent == "nix-data/" NIXDATA_VERSION_STRING);
    }

    TEST_CASE("load_context", "[nixdata::core]")
    {
        const auto restore = nixdatatests::EnvironmentCleaner("NIXDATA_CACHE_DIR", "NIXDATA_LOG_LEVEL");
        util::unset_env("NIXDATA_CACHE_DIR");
        util::unset_env("NIXDATA_LOG_LEVEL");

        SECTION("Configuration file")
        {
            const auto ctx = load_context(nixdatatests::test_data_dir / "config.yaml");
            REQUIRE(ctx.has_value());
            REQUIRE(ctx->cache_params.cache_dir == fs::path("/var/cache/nix-data-test"));
            REQUIRE(ctx->cache_params.lock_timeout == std::chrono::seconds(5));
            REQUIRE(ctx->remote_fetch_params.connect_timeout_secs == 2.5);
            REQUIRE(ctx->remote_fetch_params.transfer_timeout_secs == 60);
            REQUIRE(ctx->remote_fetch_params.ssl_verify == "<false>");
            REQUIRE(ctx->remote_fetch_params.proxy == "http://proxy.example.org:3128");
            REQUIRE(ctx->system_params.channels_url == "https://mirror.example.org/channels");
            REQUIRE(ctx->system_params.rolling_release == "23.11");
            REQUIRE(ctx->bulk_load_params.loader == BulkLoaderKind::sqlite3);
            REQUIRE(ctx->bulk_load_params.sqlite3_executable == "/usr/bin/sqlite3");
            REQUIRE(ctx->logging_params.level == log_level::debug);
        }

        SECTION("Environment overrides the file")
        {
            util::set_env("NIXDATA_CACHE_DIR", "/tmp/nixdata-env-cache");
            util::set_env("NIXDATA_LOG_LEVEL", "trace");
            const auto ctx = load_context(nixdatatests::test_data_dir / "config.yaml");
            REQUIRE(ctx.has_value());
            REQUIRE(ctx->cache_params.cache_dir == fs::path("/tmp/nixdata-env-cache"));
            REQUIRE(ctx->logging_params.level == log_level::trace);
        }

        SECTION("No file")
        {
            const auto ctx = load_context("");
            REQUIRE(ctx.has_value());
            REQUIRE(ctx->bulk_load_params.loader == BulkLoaderKind::in_process);
        }

        SECTION("Invalid value")
        {
            const auto ctx = load_context(nixdatatests::test_data_dir / "bad_config.yaml");
            REQUIRE_FALSE(ctx.has_value());
            REQUIRE(ctx.error().error_code() == nixdata_error_code::configuration_invalid);
        }

        SECTION("Missing file")
        {
            const auto ctx = load_context(nixdatatests::test_data_dir / "missing.yaml");
            REQUIRE_FALSE(ctx.has_value());
            REQUIRE(ctx.error().error_code() == nixdata_error_code::configuration_invalid);
        }
    }
}
