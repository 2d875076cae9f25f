// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "nixdata/api/resolve.hpp"
#include "nixdata/core/util.hpp"
#include "nixdata/util/url.hpp"

#include "nixdatatests.hpp"

using namespace nixdata;

namespace
{
    auto make_test_context(const fs::path& cache_dir) -> Context
    {
        auto ctx = Context();
        ctx.cache_params.cache_dir = cache_dir;
        ctx.cache_params.lock_timeout = std::chrono::seconds(0);
        ctx.system_params.release_command = { "echo", "23.05.4321.abcdef (Stoat)" };
        return ctx;
    }

    // A local channel whose version comes from the name of an empty file
    auto local_source(const fs::path& dir, const std::string& version, const char* fixture)
        -> IndexSource
    {
        const auto channel = dir / ("nixos-" + version);
        write_contents_atomic(channel, "");

        IndexSource source;
        source.name = "legacypkgs";
        source.variant = IndexVariant::plain;
        source.version_url = util::path_to_url(channel.string());
        source.index_url = util::path_to_url((nixdatatests::test_data_dir / fixture).string());
        source.version_prefix = "nixos-";
        return source;
    }

    TEST_CASE("SourceSelector names", "[nixdata::api]")
    {
        REQUIRE(source_selector_from_string("system") == SourceSelector::system);
        REQUIRE(source_selector_from_string("legacy") == SourceSelector::legacy);
        REQUIRE(source_selector_from_string("flake") == SourceSelector::flake);
        REQUIRE_FALSE(source_selector_from_string("nixpkgs").has_value());
        REQUIRE(to_string(SourceSelector::flake) == "flake");
    }

    TEST_CASE("make_source", "[nixdata::api]")
    {
        auto tmp = TemporaryDirectory();
        auto ctx = make_test_context(tmp.path());

        SECTION("System")
        {
            const auto source = make_source(ctx, SourceSelector::system);
            REQUIRE(source.has_value());
            REQUIRE(source->name == "nixospkgs");
            REQUIRE(source->version_url == "https://channels.nixos.org/nixos-23.05");
        }

        SECTION("Legacy")
        {
            const auto source = make_source(ctx, SourceSelector::legacy);
            REQUIRE(source.has_value());
            REQUIRE(source->name == "legacypkgs");
            REQUIRE(source->index_url == "https://channels.nixos.org/nixos-23.05/packages.json.br");
        }

        SECTION("Flake does not need the local release")
        {
            ctx.system_params.release_command = { "false" };
            const auto source = make_source(ctx, SourceSelector::flake);
            REQUIRE(source.has_value());
            REQUIRE(source->version_url == "https://channels.nixos.org/nixpkgs-unstable");
        }

        SECTION("Release command failure")
        {
            ctx.system_params.release_command = { "false" };
            const auto source = make_source(ctx, SourceSelector::system);
            REQUIRE_FALSE(source.has_value());
            REQUIRE(source.error().error_code() == nixdata_error_code::resolve_failed);

            REQUIRE_FALSE(ensure_store(ctx, SourceSelector::legacy).has_value());
            REQUIRE_FALSE(ensure_document(ctx).has_value());
            REQUIRE_FALSE(resolve_versions(ctx, SourceSelector::system, {}).has_value());
        }
    }

    TEST_CASE("ensure_source with a local channel", "[nixdata::api]")
    {
        auto tmp = TemporaryDirectory();
        const auto ctx = make_test_context(tmp.path() / "cache");

        const auto source = local_source(tmp.path(), "23.05.1234.abcd", "plain_index.json.zst");
        const auto store = ensure_source(ctx, source);
        REQUIRE(store.has_value());
        REQUIRE(*store == tmp.path() / "cache" / "legacypkgs.db");
        REQUIRE(read_contents(tmp.path() / "cache" / "legacypkgs.ver") == "23.05.1234.abcd");

        // Same version, the index is not fetched again
        auto unreachable = source;
        unreachable.index_url = util::path_to_url((tmp.path() / "gone.json").string());
        REQUIRE(ensure_source(ctx, unreachable).has_value());

        // New version, the missing index fails the cycle and keeps the marker
        const auto next = local_source(tmp.path(), "23.05.5678.ef01", "missing.json");
        const auto failed = ensure_source(ctx, next);
        REQUIRE_FALSE(failed.has_value());
        REQUIRE(failed.error().error_code() == nixdata_error_code::fetch_failed);
        REQUIRE(read_contents(tmp.path() / "cache" / "legacypkgs.ver") == "23.05.1234.abcd");
    }

    TEST_CASE("resolve_versions with a local channel", "[nixdata::api]")
    {
        auto tmp = TemporaryDirectory();
        auto ctx = make_test_context(tmp.path() / "cache");
        const auto& data = nixdatatests::test_data_dir;

        const auto config = tmp.path() / "configuration.nix";
        write_contents_atomic(config, "{ environment.systemPackages = with pkgs; [ pkgA pkgC ]; }");
        const auto source = local_source(tmp.path(), "23.05.1", "plain_index.json");

        SECTION("In-process loader")
        {
            const auto versions = resolve_versions(ctx, source, { config, data / "missing.nix" });
            REQUIRE(versions.has_value());
            REQUIRE(*versions == VersionMap{ { "pkgA", "1.0" } });
        }

        SECTION("External loader")
        {
            if (util::which("sqlite3").empty())
            {
                WARN("sqlite3 executable not found, skipping external loader");
                return;
            }
            ctx.bulk_load_params.loader = BulkLoaderKind::sqlite3;
            const auto versions = resolve_versions(ctx, source, { config });
            REQUIRE(versions.has_value());
            REQUIRE(*versions == VersionMap{ { "pkgA", "1.0" } });
        }

        SECTION("No readable declaration")
        {
            const auto versions = resolve_versions(ctx, source, { data / "missing.nix" });
            REQUIRE(versions.has_value());
            REQUIRE(versions->empty());
        }
    }

    TEST_CASE("Options document with a local channel", "[nixdata::api]")
    {
        auto tmp = TemporaryDirectory();
        const auto ctx = make_test_context(tmp.path() / "cache");

        auto source = local_source(tmp.path(), "23.05.1", "options.json");
        source.name = "nixosoptions";
        source.variant = IndexVariant::raw;

        const auto document = ensure_source(ctx, source);
        REQUIRE(document.has_value());
        REQUIRE(*document == tmp.path() / "cache" / "nixosoptions.json");
        REQUIRE(read_contents(*document) == read_contents(nixdatatests::test_data_dir / "options.json"));
    }
}
