// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <map>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "nixdata/core/attribute_collector.hpp"

#include "nixdatatests.hpp"

using namespace nixdata;

namespace
{
    using Values = std::vector<std::string>;

    TEST_CASE("NixListReader", "[nixdata::core]")
    {
        auto reader = NixListReader();
        constexpr auto key = "environment.systemPackages";

        SECTION("Plain list")
        {
            const auto values = reader.read("{ environment.systemPackages = [ a b.c ]; }", key);
            REQUIRE(values.has_value());
            REQUIRE(*values == Values{ "a", "b.c" });
        }

        SECTION("With expression and comments")
        {
            const auto values = reader.read(
                "environment.systemPackages = with pkgs; [\n"
                "  firefox # browser\n"
                "  /* git */ vim\n"
                "];\n",
                key
            );
            REQUIRE(values.has_value());
            REQUIRE(*values == Values{ "firefox", "vim" });
        }

        SECTION("Nested with expressions")
        {
            const auto values = reader.read("environment.systemPackages = with pkgs; with lib; [ x ];", key);
            REQUIRE(values.has_value());
            REQUIRE(*values == Values{ "x" });
        }

        SECTION("Parenthesized and string elements")
        {
            const auto values = reader.read(
                R"(environment.systemPackages = [ (f (x: [ x ])) "a b" ];)",
                key
            );
            REQUIRE(values.has_value());
            REQUIRE(*values == Values{ "(f (x: [ x ]))", "\"a b\"" });
        }

        SECTION("Empty list")
        {
            const auto values = reader.read("environment.systemPackages = [ ];", key);
            REQUIRE(values.has_value());
            REQUIRE(values->empty());
        }

        SECTION("Commented definition is ignored")
        {
            const auto values = reader.read(
                "# environment.systemPackages = [ old ];\nenvironment.systemPackages = [ new ];",
                key
            );
            REQUIRE(values.has_value());
            REQUIRE(*values == Values{ "new" });
        }

        SECTION("Longer keys do not match")
        {
            const auto values = reader.read("environment.systemPackagesExtra = [ a ];", key);
            REQUIRE_FALSE(values.has_value());
            REQUIRE(values.error().error_code() == nixdata_error_code::config_read_failed);
        }

        SECTION("With keyword followed by any whitespace")
        {
            const auto values = reader.read(
                "environment.systemPackages = with\n  pkgs;\twith\tlib; [ firefox ];",
                key
            );
            REQUIRE(values.has_value());
            REQUIRE(*values == Values{ "firefox" });
        }

        SECTION("Identifiers starting with the with keyword")
        {
            const auto values = reader.read("environment.systemPackages = withPkgs;", key);
            REQUIRE_FALSE(values.has_value());
            REQUIRE(values.error().error_code() == nixdata_error_code::config_read_failed);
        }

        SECTION("Key inside a string literal")
        {
            const auto values = reader.read(
                "{\n"
                "  description = \"set environment.systemPackages = [ wrong ];\";\n"
                "  environment.systemPackages = [ right ];\n"
                "}\n",
                key
            );
            REQUIRE(values.has_value());
            REQUIRE(*values == Values{ "right" });
        }

        SECTION("Indented strings")
        {
            const auto values = reader.read(
                "{\n"
                "  services.foo.extraConfig = ''\n"
                "    say \"hi # not a comment\n"
                "    environment.systemPackages = [ wrong ];\n"
                "    escaped ''' and ''${x} here\n"
                "  '';\n"
                "  environment.systemPackages = [ htop ''two words'' ]; # \"\n"
                "}\n",
                key
            );
            REQUIRE(values.has_value());
            REQUIRE(*values == Values{ "htop", "''two words''" });
        }

        SECTION("Errors")
        {
            REQUIRE_FALSE(reader.read("{ }", key).has_value());
            REQUIRE_FALSE(reader.read("environment.systemPackages = pkgs.hello;", key).has_value());
            REQUIRE_FALSE(reader.read("environment.systemPackages = [ a b", key).has_value());
            REQUIRE_FALSE(reader.read("environment.systemPackages = with ; [ a ];", key).has_value());
        }
    }

    TEST_CASE("AttributeCollector", "[nixdata::core]")
    {
        auto reader = NixListReader();
        const auto collector = AttributeCollector(reader);
        const auto& data = nixdatatests::test_data_dir;

        SECTION("Union of all sources")
        {
            const auto packages = collector.collect({ data / "configuration.nix", data / "packages.nix" });
            REQUIRE(
                packages
                == DeclaredPackageSet{
                    "firefox",
                    "vim",
                    "(python3.withPackages (ps: [ ps.requests ]))",
                    "pkgs.hello",
                    "htop",
                }
            );
        }

        SECTION("Unreadable and unparsable sources are skipped")
        {
            const auto packages = collector.collect({
                data / "missing.nix",
                data / "no_packages.nix",
                data / "packages.nix",
            });
            REQUIRE(packages == DeclaredPackageSet{ "pkgs.hello", "vim", "htop" });
        }

        SECTION("Every source failing gives an empty set")
        {
            REQUIRE(collector.collect({ data / "missing.nix", data / "no_packages.nix" }).empty());
        }

        SECTION("Custom key")
        {
            const auto imports = AttributeCollector(reader, "imports").collect({ data / "configuration.nix" });
            REQUIRE(imports == DeclaredPackageSet{ "./hardware-configuration.nix" });
        }
    }

    class CountingReader : public DeclarationReader
    {
    public:

        std::map<std::string, int> calls;

    private:

        auto read_impl(std::string_view content, std::string_view key)
            -> expected_t<std::vector<std::string>> override
        {
            ++calls[std::string(key)];
            if (content.empty())
            {
                return make_unexpected("empty", nixdata_error_code::config_read_failed);
            }
            return { Values{ std::string(content) } };
        }
    };

    TEST_CASE("AttributeCollector with another reader", "[nixdata::core]")
    {
        auto reader = CountingReader();
        const auto packages = AttributeCollector(reader, "packages")
                                  .collect({ nixdatatests::test_data_dir / "no_packages.nix" });
        REQUIRE(reader.calls["packages"] == 1);
        REQUIRE(packages.size() == 1);
    }
}
