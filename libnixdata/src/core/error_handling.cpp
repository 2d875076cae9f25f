// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "nixdata/core/error_handling.hpp"

namespace nixdata
{
    auto to_string(nixdata_error_code ec) -> const char*
    {
        switch (ec)
        {
            case nixdata_error_code::resolve_failed:
                return "resolve_failed";
            case nixdata_error_code::fetch_failed:
                return "fetch_failed";
            case nixdata_error_code::decode_failed:
                return "decode_failed";
            case nixdata_error_code::store_failed:
                return "store_failed";
            case nixdata_error_code::subprocess_failed:
                return "subprocess_failed";
            case nixdata_error_code::config_read_failed:
                return "config_read_failed";
            case nixdata_error_code::cache_locked:
                return "cache_locked";
            case nixdata_error_code::configuration_invalid:
                return "configuration_invalid";
            case nixdata_error_code::unknown:
                break;
        }
        return "unknown";
    }

    nixdata_error::nixdata_error(const std::string& msg, nixdata_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    nixdata_error::nixdata_error(const char* msg, nixdata_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    nixdata_error_code nixdata_error::error_code() const noexcept
    {
        return m_error_code;
    }

    tl::unexpected<nixdata_error> make_unexpected(const char* msg, nixdata_error_code ec)
    {
        return tl::make_unexpected(nixdata_error(msg, ec));
    }

    tl::unexpected<nixdata_error> make_unexpected(const std::string& msg, nixdata_error_code ec)
    {
        return tl::make_unexpected(nixdata_error(msg, ec));
    }
}
