// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_UTIL_URL_HPP
#define NIXDATA_UTIL_URL_HPP

#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace nixdata::util
{
    struct ParseError
    {
        std::string message = {};
    };

    /**
     * Return the decoded path of a URL, e.g. ``/nixos-23.05`` for
     * ``https://channels.nixos.org/nixos-23.05?x=1``.
     */
    [[nodiscard]] auto url_path(const std::string& url) -> tl::expected<std::string, ParseError>;

    /**
     * Return the non empty segments of the URL path, in order.
     */
    [[nodiscard]] auto url_path_segments(const std::string& url)
        -> tl::expected<std::vector<std::string>, ParseError>;

    /**
     * Return a ``file://`` URL for an absolute local path.
     */
    [[nodiscard]] auto path_to_url(const std::string& path) -> std::string;
}
#endif
