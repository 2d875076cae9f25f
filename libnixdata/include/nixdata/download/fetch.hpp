// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_DOWNLOAD_FETCH_HPP
#define NIXDATA_DOWNLOAD_FETCH_HPP

#include <string>

#include "nixdata/core/error_handling.hpp"
#include "nixdata/download/parameters.hpp"

namespace nixdata::download
{
    struct Request
    {
        std::string url;
        // Only follow redirects and read the headers, the body is not transferred.
        bool headers_only = false;
    };

    struct Response
    {
        long http_status = 0;
        std::string effective_url;
        // Decoded body, empty for headers only requests
        std::string content;

        // 2xx for HTTP(S), and a completed transfer for file:// URLs.
        [[nodiscard]] auto is_success() const -> bool;
    };

    /**
     * Perform a blocking transfer, following redirects.
     *
     * The body is decoded according to the ``Content-Encoding`` header or, without one,
     * the URL suffix. Transport and decoding failures are ``fetch_failed`` errors; an
     * unsuccessful HTTP status is not an error at this level and is reported in the
     * ``Response``.
     */
    [[nodiscard]] auto fetch(const Request& request, const RemoteFetchParams& params)
        -> expected_t<Response>;
}

#endif
