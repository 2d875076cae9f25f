// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <reproc++/run.hpp>

#include "nixdata/util/os.hpp"
#include "nixdata/util/string.hpp"

namespace nixdata::util
{
    auto nixos_version(const std::vector<std::string>& command) -> tl::expected<std::string, OSError>
    {
        if (command.empty())
        {
            return tl::make_unexpected(OSError{ "Empty release command" });
        }

        auto out = std::string();
        auto err = std::string();

        auto [status, ec] = reproc::run(
            command,
            reproc::options{},
            reproc::sink::string(out),
            reproc::sink::string(err)
        );

        if (ec)
        {
            return tl::make_unexpected(OSError{ fmt::format(
                R"(Could not find NixOS version by calling "{}": {})",
                fmt::join(command, " "),
                ec.message()
            ) });
        }
        if (status != 0)
        {
            return tl::make_unexpected(OSError{ fmt::format(
                R"(Command "{}" exited with status {}: {})",
                fmt::join(command, " "),
                status,
                strip(err)
            ) });
        }

        return { std::string(strip(out)) };
    }
}
