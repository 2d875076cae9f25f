// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>

#include "nixdata/util/string.hpp"

namespace nixdata::util
{
    /****************************************
     *  Implementation of cctype functions  *
     ****************************************/

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string(str);
        std::transform(out.cbegin(), out.cend(), out.begin(), [](char c) { return to_lower(c); });
        return out;
    }

    /************************************
     *  Implementation of affix functions  *
     ************************************/

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        if (suffix.size() > str.size())
        {
            return false;
        }
        return str.substr(str.size() - suffix.size()) == suffix;
    }

    auto remove_prefix(std::string_view str, std::string_view prefix) -> std::string_view
    {
        if (starts_with(str, prefix))
        {
            return str.substr(prefix.size());
        }
        return str;
    }

    /*************************************
     *  Implementation of strip functions  *
     *************************************/

    auto lstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const auto start = input.find_first_not_of(chars);
        return start == std::string_view::npos ? std::string_view{} : input.substr(start);
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        return lstrip(input, whitespaces());
    }

    auto rstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const auto end = input.find_last_not_of(chars);
        return end == std::string_view::npos ? std::string_view{} : input.substr(0, end + 1);
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        return rstrip(input, whitespaces());
    }

    auto strip(std::string_view input, std::string_view chars) -> std::string_view
    {
        return lstrip(rstrip(input, chars), chars);
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return strip(input, whitespaces());
    }

    /*************************************
     *  Implementation of split functions  *
     *************************************/

    auto split(std::string_view input, std::string_view sep) -> std::vector<std::string>
    {
        std::vector<std::string> result;
        if (sep.empty())
        {
            result.emplace_back(input);
            return result;
        }
        std::size_t start = 0;
        while (true)
        {
            const auto pos = input.find(sep, start);
            if (pos == std::string_view::npos)
            {
                result.emplace_back(input.substr(start));
                break;
            }
            result.emplace_back(input.substr(start, pos - start));
            start = pos + sep.size();
        }
        return result;
    }
}
