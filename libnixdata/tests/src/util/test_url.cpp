// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "nixdata/util/url.hpp"

using namespace nixdata::util;

namespace
{
    TEST_CASE("url_path", "[nixdata::util]")
    {
        REQUIRE(url_path("https://channels.nixos.org/nixos-23.05").value() == "/nixos-23.05");
        REQUIRE(url_path("https://releases.nixos.org/nixos/23.05/nixos-23.05.1234.abcd?x=1").value()
                == "/nixos/23.05/nixos-23.05.1234.abcd");
        REQUIRE(url_path("file:///tmp/cache/nixos-23.05").value() == "/tmp/cache/nixos-23.05");
        REQUIRE(url_path("https://example.org/a%20b").value() == "/a b");
    }

    TEST_CASE("url_path_segments", "[nixdata::util]")
    {
        SECTION("Empty segments are skipped")
        {
            const auto segments = url_path_segments("https://releases.nixos.org//nixos/23.05/");
            REQUIRE(segments.has_value());
            REQUIRE(*segments == std::vector<std::string>{ "nixos", "23.05" });
        }

        SECTION("No path")
        {
            const auto segments = url_path_segments("https://channels.nixos.org");
            REQUIRE(segments.has_value());
            REQUIRE(segments->empty());
        }

        SECTION("Invalid URL")
        {
            REQUIRE_FALSE(url_path_segments("http://[invalid").has_value());
        }
    }

    TEST_CASE("path_to_url", "[nixdata::util]")
    {
        REQUIRE(path_to_url("/tmp/index.json") == "file:///tmp/index.json");
        REQUIRE(path_to_url("file:///tmp/index.json") == "file:///tmp/index.json");
    }
}
