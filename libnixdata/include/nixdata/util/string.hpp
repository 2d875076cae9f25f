// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_UTIL_STRING_HPP
#define NIXDATA_UTIL_STRING_HPP

#include <string>
#include <string_view>
#include <vector>

namespace nixdata::util
{
    /**
     * Return the string of whitespace characters.
     */
    [[nodiscard]] constexpr auto whitespaces() -> std::string_view
    {
        return " \r\n\t\f\v";
    }

    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;

    /**
     * Return a view to the input without the prefix if present.
     */
    [[nodiscard]] auto remove_prefix(std::string_view str, std::string_view prefix)
        -> std::string_view;

    [[nodiscard]] auto lstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Split the input on every occurence of the separator.
     *
     * Empty parts are kept, so that joining the result gives back the input.
     */
    [[nodiscard]] auto split(std::string_view input, std::string_view sep)
        -> std::vector<std::string>;
}

#endif
