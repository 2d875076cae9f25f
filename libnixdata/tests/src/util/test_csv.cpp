// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <sstream>

#include <catch2/catch_all.hpp>

#include "nixdata/util/csv.hpp"

using namespace nixdata::util;

namespace
{
    TEST_CASE("csv_escape", "[nixdata::util]")
    {
        SECTION("Plain fields are unchanged")
        {
            REQUIRE(csv_escape("") == "");
            REQUIRE(csv_escape("firefox") == "firefox");
            REQUIRE(csv_escape("https://x.org/a b") == "https://x.org/a b");
        }

        SECTION("Delimiters and line breaks are quoted")
        {
            REQUIRE(csv_escape("a,b") == "\"a,b\"");
            REQUIRE(csv_escape("line\nbreak") == "\"line\nbreak\"");
            REQUIRE(csv_escape("cr\r") == "\"cr\r\"");
        }

        SECTION("Quotes are doubled")
        {
            REQUIRE(csv_escape(R"(say "hi")") == R"("say ""hi""")");
            REQUIRE(csv_escape(R"({"a":1,"b":2})") == R"("{""a"":1,""b"":2}")");
        }
    }

    TEST_CASE("write_csv_row", "[nixdata::util]")
    {
        std::ostringstream out;
        write_csv_row(out, { "pkgA", "a", "1.0" });
        write_csv_row(out, { "pkgB", "", "x,y" });
        write_csv_row(out, {});
        REQUIRE(out.str() == "pkgA,a,1.0\npkgB,,\"x,y\"\n\n");
    }
}
