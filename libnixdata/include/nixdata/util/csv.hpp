// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_UTIL_CSV_HPP
#define NIXDATA_UTIL_CSV_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace nixdata::util
{
    /**
     * Quote a field following RFC 4180.
     *
     * Fields containing a comma, a double quote, a carriage return or a line feed are
     * enclosed in double quotes, with inner double quotes doubled. Other fields are
     * returned unchanged.
     */
    [[nodiscard]] auto csv_escape(std::string_view field) -> std::string;

    /**
     * Write one CSV record terminated by a line feed.
     */
    void write_csv_row(std::ostream& out, const std::vector<std::string>& fields);
}

#endif
