// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "nixdata/core/index_source.hpp"

using namespace nixdata;

namespace
{
    TEST_CASE("normalize_release", "[nixdata::core]")
    {
        REQUIRE(normalize_release("23.05.1234.abcdef (Stoat)\n", "22.11") == "23.05");
        REQUIRE(normalize_release("22.11.4321.fedcba", "22.11") == "unstable");
        REQUIRE(normalize_release("23.11", "23.11") == "unstable");
        REQUIRE(normalize_release("23", "22.11") == "23");
        REQUIRE(normalize_release("", "22.11") == "");
    }

    TEST_CASE("system_source", "[nixdata::core]")
    {
        const auto source = system_source(SystemParams{}, "23.05");
        REQUIRE(source.name == "nixospkgs");
        REQUIRE(source.variant == IndexVariant::extended);
        REQUIRE(source.version_url == "https://channels.nixos.org/nixos-23.05");
        REQUIRE(source.index_url == "https://channels.nixos.org/nixos-23.05/packages.json.br");
        REQUIRE(source.version_prefix == "nixos-");
        REQUIRE(source.artifact_filename() == "nixospkgs.db");
        REQUIRE(source.marker_filename() == "nixospkgs.ver");
        REQUIRE(source.lock_filename() == "nixospkgs.lock");
    }

    TEST_CASE("legacy_source", "[nixdata::core]")
    {
        auto params = SystemParams{};
        params.channels_url = "https://mirror.example.org/channels/";
        const auto source = legacy_source(params, "nixos-unstable");
        REQUIRE(source.name == "legacypkgs");
        REQUIRE(source.variant == IndexVariant::plain);
        REQUIRE(source.version_url == "https://mirror.example.org/channels/nixos-unstable");
        REQUIRE(
            source.index_url == "https://mirror.example.org/channels/nixos-unstable/packages.json.br"
        );
        REQUIRE(source.version_prefix == "nixos-");
    }

    TEST_CASE("flake_source", "[nixdata::core]")
    {
        const auto source = flake_source(SystemParams{});
        REQUIRE(source.name == "flakespkgs");
        REQUIRE(source.variant == IndexVariant::plain);
        REQUIRE(source.version_url == "https://channels.nixos.org/nixpkgs-unstable");
        REQUIRE(source.version_prefix == "nixpkgs-");
        REQUIRE(source.artifact_filename() == "flakespkgs.db");
    }

    TEST_CASE("options_source", "[nixdata::core]")
    {
        const auto source = options_source(SystemParams{}, "unstable");
        REQUIRE(source.name == "nixosoptions");
        REQUIRE(source.variant == IndexVariant::raw);
        REQUIRE(source.index_url == "https://channels.nixos.org/nixos-unstable/options.json.br");
        REQUIRE(source.artifact_filename() == "nixosoptions.json");
        REQUIRE(source.marker_filename() == "nixosoptions.ver");
    }
}
