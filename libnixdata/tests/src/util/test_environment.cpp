// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "nixdata/util/environment.hpp"

#include "nixdatatests.hpp"

using namespace nixdata;
using namespace nixdata::util;

namespace
{
    TEST_CASE("get_env", "[nixdata::util]")
    {
        const auto restore = nixdatatests::EnvironmentCleaner("NIXDATA_TEST_VARIABLE");

        unset_env("NIXDATA_TEST_VARIABLE");
        REQUIRE_FALSE(get_env("NIXDATA_TEST_VARIABLE").has_value());

        set_env("NIXDATA_TEST_VARIABLE", "value");
        REQUIRE(get_env("NIXDATA_TEST_VARIABLE") == "value");
    }

    TEST_CASE("user_cache_dir", "[nixdata::util]")
    {
        const auto restore = nixdatatests::EnvironmentCleaner("XDG_CACHE_HOME", "HOME");

        SECTION("XDG_CACHE_HOME")
        {
            set_env("XDG_CACHE_HOME", "/tmp/xdg-cache");
            REQUIRE(user_cache_dir() == fs::path("/tmp/xdg-cache"));
        }

        SECTION("Fallback on HOME")
        {
            unset_env("XDG_CACHE_HOME");
            set_env("HOME", "/home/someone");
            REQUIRE(user_cache_dir() == fs::path("/home/someone/.cache"));
        }
    }

    TEST_CASE("which", "[nixdata::util]")
    {
        REQUIRE(which("sh").filename() == "sh");
        REQUIRE(which("nixdata-no-such-executable-xyz").empty());
    }
}
