// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_DOWNLOAD_PARAMETERS_HPP
#define NIXDATA_DOWNLOAD_PARAMETERS_HPP

#include <optional>
#include <string>

namespace nixdata::download
{
    struct RemoteFetchParams
    {
        // ssl_verify can be either an empty string (regular SSL verification),
        // the string "<false>" to indicate no SSL verification, or a path to
        // a cert file.
        std::string ssl_verify = "";

        std::string user_agent = "";

        double connect_timeout_secs = 10.;
        // Whole transfer, 0 disables the limit
        long transfer_timeout_secs = 300;

        std::optional<std::string> proxy = std::nullopt;
    };
}
#endif
