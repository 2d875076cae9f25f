// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "nixdata/util/csv.hpp"

namespace nixdata::util
{
    auto csv_escape(std::string_view field) -> std::string
    {
        if (field.find_first_of(",\"\r\n") == std::string_view::npos)
        {
            return std::string(field);
        }
        std::string out;
        out.reserve(field.size() + 2);
        out += '"';
        for (const char c : field)
        {
            if (c == '"')
            {
                out += '"';
            }
            out += c;
        }
        out += '"';
        return out;
    }

    void write_csv_row(std::ostream& out, const std::vector<std::string>& fields)
    {
        bool first = true;
        for (const auto& field : fields)
        {
            if (!first)
            {
                out << ',';
            }
            first = false;
            out << csv_escape(field);
        }
        out << '\n';
    }
}
