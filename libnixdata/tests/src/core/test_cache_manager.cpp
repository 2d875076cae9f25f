// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <system_error>

#include <catch2/catch_all.hpp>

#include "nixdata/core/cache_manager.hpp"
#include "nixdata/core/query_resolver.hpp"
#include "nixdata/core/util.hpp"

#include "nixdatatests.hpp"

using namespace nixdata;

namespace
{
    class FakeResolver : public VersionResolver
    {
    public:

        std::string version = "23.05";
        bool fail = false;
        int calls = 0;

    private:

        auto resolve_impl(const IndexSource&) -> expected_t<std::string> override
        {
            ++calls;
            if (fail)
            {
                return make_unexpected("no redirect", nixdata_error_code::resolve_failed);
            }
            return { version };
        }
    };

    class FakeFetcher : public FetchDecoder
    {
    public:

        std::string fixture = "plain_index.json";
        int calls = 0;

    private:

        auto fetch_impl(const IndexSource&) -> expected_t<std::string> override
        {
            ++calls;
            try
            {
                return { read_contents(nixdatatests::test_data_dir / fixture) };
            }
            catch (const std::system_error& e)
            {
                return make_unexpected(e.what(), nixdata_error_code::fetch_failed);
            }
        }
    };

    auto test_source(IndexVariant variant = IndexVariant::plain) -> IndexSource
    {
        IndexSource source;
        source.name = (variant == IndexVariant::raw) ? "nixosoptions" : "legacypkgs";
        source.variant = variant;
        source.version_url = "https://channels.example.org/nixos-23.05";
        source.index_url = "https://channels.example.org/nixos-23.05/packages.json.br";
        source.version_prefix = "nixos-";
        return source;
    }

    class CacheManagerTest
    {
    protected:

        TemporaryDirectory tmp;
        FakeResolver resolver;
        FakeFetcher fetcher;
        InProcessBulkLoader loader;
        CacheManager manager{ CacheParams{ tmp.path() / "cache", std::chrono::seconds(0) },
                              resolver,
                              fetcher,
                              loader };
        IndexSource source = test_source();

        auto cache_file(const std::string& name) const -> fs::path
        {
            return tmp.path() / "cache" / name;
        }
    };

    TEST_CASE_METHOD(CacheManagerTest, "Cache miss builds the store and writes the marker", "[nixdata::core]")
    {
        const auto path = manager.ensure(source);
        REQUIRE(path.has_value());
        REQUIRE(*path == cache_file("legacypkgs.db"));
        REQUIRE(fs::exists(*path));
        REQUIRE(read_contents(cache_file("legacypkgs.ver")) == "23.05");
        REQUIRE(resolver.calls == 1);
        REQUIRE(fetcher.calls == 1);

        auto query = QueryResolver(*path);
        REQUIRE(*query.resolve({ "pkgA", "pkgC" }) == VersionMap{ { "pkgA", "1.0" } });
    }

    TEST_CASE_METHOD(CacheManagerTest, "Unusable cache directory", "[nixdata::core]")
    {
        // A regular file where the cache directory should be
        write_contents_atomic(tmp.path() / "cache", "");

        const auto path = manager.ensure(source);
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().error_code() == nixdata_error_code::store_failed);
        REQUIRE_THAT(path.error().what(), Catch::Matchers::ContainsSubstring("cache directory"));
        REQUIRE(resolver.calls == 0);
        REQUIRE(fetcher.calls == 0);
    }

    TEST_CASE_METHOD(CacheManagerTest, "Matching marker is a cache hit", "[nixdata::core]")
    {
        fs::create_directories(cache_file(""));
        write_contents_atomic(cache_file("legacypkgs.ver"), "23.05");
        write_contents_atomic(cache_file("legacypkgs.db"), "");

        const auto path = manager.ensure(source);
        REQUIRE(path.has_value());
        REQUIRE(*path == cache_file("legacypkgs.db"));
        REQUIRE(resolver.calls == 1);
        REQUIRE(fetcher.calls == 0);
        REQUIRE(fs::file_size(*path) == 0);
    }

    TEST_CASE_METHOD(CacheManagerTest, "Outdated marker triggers a rebuild", "[nixdata::core]")
    {
        fs::create_directories(cache_file(""));
        write_contents_atomic(cache_file("legacypkgs.ver"), "22.11");
        write_contents_atomic(cache_file("legacypkgs.db"), "not a store");

        const auto path = manager.ensure(source);
        REQUIRE(path.has_value());
        REQUIRE(fetcher.calls == 1);
        REQUIRE(read_contents(cache_file("legacypkgs.ver")) == "23.05");
        REQUIRE(QueryResolver(*path).package("pkgB")->has_value());
    }

    TEST_CASE_METHOD(CacheManagerTest, "Missing artifact triggers a rebuild", "[nixdata::core]")
    {
        fs::create_directories(cache_file(""));
        write_contents_atomic(cache_file("legacypkgs.ver"), "23.05");

        REQUIRE(manager.ensure(source).has_value());
        REQUIRE(fetcher.calls == 1);
    }

    TEST_CASE_METHOD(CacheManagerTest, "Freshness check is idempotent", "[nixdata::core]")
    {
        REQUIRE(manager.ensure(source).has_value());
        REQUIRE(manager.ensure(source).has_value());
        REQUIRE(manager.ensure(source).has_value());
        REQUIRE(resolver.calls == 3);
        REQUIRE(fetcher.calls == 1);

        resolver.version = "23.11";
        REQUIRE(manager.ensure(source).has_value());
        REQUIRE(resolver.calls == 4);
        REQUIRE(fetcher.calls == 2);
        REQUIRE(manager.manifest(source).version == "23.11");
    }

    TEST_CASE_METHOD(CacheManagerTest, "Failures leave the marker untouched", "[nixdata::core]")
    {
        REQUIRE(manager.ensure(source).has_value());

        SECTION("Resolve failure")
        {
            resolver.fail = true;
            const auto path = manager.ensure(source);
            REQUIRE_FALSE(path.has_value());
            REQUIRE(path.error().error_code() == nixdata_error_code::resolve_failed);
            REQUIRE(fetcher.calls == 1);
        }

        SECTION("Fetch failure")
        {
            resolver.version = "23.11";
            fetcher.fixture = "missing.json";
            const auto path = manager.ensure(source);
            REQUIRE_FALSE(path.has_value());
            REQUIRE(path.error().error_code() == nixdata_error_code::fetch_failed);
        }

        SECTION("Decode failure")
        {
            resolver.version = "23.11";
            fetcher.fixture = "malformed_index.json";
            const auto path = manager.ensure(source);
            REQUIRE_FALSE(path.has_value());
            REQUIRE(path.error().error_code() == nixdata_error_code::decode_failed);
        }

        REQUIRE(read_contents(cache_file("legacypkgs.ver")) == "23.05");
    }

    TEST_CASE_METHOD(CacheManagerTest, "Raw documents are stored verbatim", "[nixdata::core]")
    {
        const auto options = test_source(IndexVariant::raw);
        fetcher.fixture = "options.json";

        const auto path = manager.ensure(options);
        REQUIRE(path.has_value());
        REQUIRE(*path == cache_file("nixosoptions.json"));
        REQUIRE(read_contents(*path) == read_contents(nixdatatests::test_data_dir / "options.json"));
        REQUIRE(read_contents(cache_file("nixosoptions.ver")) == "23.05");

        REQUIRE(manager.ensure(options).has_value());
        REQUIRE(fetcher.calls == 1);
    }

    TEST_CASE_METHOD(CacheManagerTest, "Held lock makes the cycle fail", "[nixdata::core]")
    {
        fs::create_directories(cache_file(""));
        const auto lock = LockFile::acquire(cache_file("legacypkgs.lock"), std::chrono::seconds(0));
        REQUIRE(lock.has_value());

        const auto path = manager.ensure(source);
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().error_code() == nixdata_error_code::cache_locked);
        REQUIRE(resolver.calls == 0);
    }

    TEST_CASE("CacheManifest", "[nixdata::core]")
    {
        auto tmp = TemporaryDirectory();
        const auto source = test_source();

        auto manifest = CacheManifest::read(tmp.path(), source);
        REQUIRE(manifest.artifact_path == tmp.path() / "legacypkgs.db");
        REQUIRE(manifest.marker_path == tmp.path() / "legacypkgs.ver");
        REQUIRE_FALSE(manifest.version.has_value());
        REQUIRE_FALSE(manifest.is_fresh("23.05"));

        write_contents_atomic(manifest.marker_path, "23.05");
        manifest = CacheManifest::read(tmp.path(), source);
        REQUIRE(manifest.version == "23.05");
        REQUIRE_FALSE(manifest.is_fresh("23.05"));

        write_contents_atomic(manifest.artifact_path, "");
        REQUIRE(manifest.is_fresh("23.05"));
        REQUIRE_FALSE(manifest.is_fresh("23.05.1"));
        REQUIRE_FALSE(manifest.is_fresh("23.0"));
    }
}
