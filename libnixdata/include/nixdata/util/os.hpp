// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_UTIL_OS_HPP
#define NIXDATA_UTIL_OS_HPP

#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace nixdata::util
{
    struct OSError
    {
        std::string message = {};
    };

    /**
     * Run the release command of the running NixOS system and return its trimmed output.
     *
     * The command is typically ``nixos-version``, printing something like
     * ``23.05.1234.abcdef (Stoat)``.
     */
    [[nodiscard]] auto nixos_version(const std::vector<std::string>& command)
        -> tl::expected<std::string, OSError>;
}
#endif
