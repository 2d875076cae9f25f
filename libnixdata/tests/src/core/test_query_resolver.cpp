// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "nixdata/core/query_resolver.hpp"
#include "nixdata/core/util.hpp"

#include "core/sqlite.hpp"

using namespace nixdata;

namespace
{
    // A pkgs table without the unique constraint, so that an attribute may match several rows
    auto make_loose_store(const fs::path& path) -> fs::path
    {
        SQLiteDatabase db(path, SQLiteDatabase::OpenMode::create);
        db.execute(R"sql(
            CREATE TABLE "pkgs" ("attribute" TEXT, "pname" TEXT, "version" TEXT);
            INSERT INTO "pkgs" VALUES ('hello', 'hello', '2.12.1');
            INSERT INTO "pkgs" VALUES ('python3', 'python3', '3.10.12');
            INSERT INTO "pkgs" VALUES ('python3', 'python3', '3.11.4');
            INSERT INTO "pkgs" VALUES ('git', 'git', '');
        )sql");
        return path;
    }

    TEST_CASE("QueryResolver keeps identifiers with exactly one match", "[nixdata::core]")
    {
        auto tmp = TemporaryDirectory();
        auto query = QueryResolver(make_loose_store(tmp.path() / "loose.db"));

        SECTION("Zero, one and several matches")
        {
            const auto versions = query.resolve({ "hello", "python3", "firefox" });
            REQUIRE(versions.has_value());
            REQUIRE(*versions == VersionMap{ { "hello", "2.12.1" } });
            REQUIRE(query.stats().dropped == 2);
        }

        SECTION("Empty version is still a match")
        {
            const auto versions = query.resolve({ "git" });
            REQUIRE(versions.has_value());
            REQUIRE(*versions == VersionMap{ { "git", "" } });
            REQUIRE(query.stats().dropped == 0);
        }

        SECTION("Empty set")
        {
            const auto versions = query.resolve({});
            REQUIRE(versions.has_value());
            REQUIRE(versions->empty());
        }

        SECTION("Statistics are reset on every resolve")
        {
            REQUIRE(query.resolve({ "python3" }).has_value());
            REQUIRE(query.stats().dropped == 1);
            REQUIRE(query.resolve({ "hello" }).has_value());
            REQUIRE(query.stats().dropped == 0);
        }
    }

    TEST_CASE("QueryResolver on a plain store without meta", "[nixdata::core]")
    {
        auto tmp = TemporaryDirectory();
        auto query = QueryResolver(make_loose_store(tmp.path() / "loose.db"));

        const auto meta = query.meta("hello");
        REQUIRE_FALSE(meta.has_value());
        REQUIRE(meta.error().error_code() == nixdata_error_code::store_failed);

        const auto pythons = query.by_pname("python3");
        REQUIRE(pythons.has_value());
        REQUIRE(pythons->size() == 2);
    }

    TEST_CASE("QueryResolver on an invalid store", "[nixdata::core]")
    {
        auto tmp = TemporaryDirectory();

        SECTION("Missing file")
        {
            REQUIRE_THROWS_AS(QueryResolver(tmp.path() / "missing.db"), nixdata_error);
        }

        SECTION("No pkgs table")
        {
            const auto path = tmp.path() / "empty.db";
            SQLiteDatabase(path, SQLiteDatabase::OpenMode::create).execute("CREATE TABLE t (x)");
            REQUIRE_THROWS_AS(QueryResolver(path), nixdata_error);
        }
    }
}
