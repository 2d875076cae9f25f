// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <utility>

#include <fmt/format.h>

#include "nixdata/core/fetch_decoder.hpp"
#include "nixdata/core/output.hpp"
#include "nixdata/download/fetch.hpp"

namespace nixdata
{
    /****************
     * FetchDecoder *
     ****************/

    auto FetchDecoder::fetch(const IndexSource& source) -> expected_t<std::string>
    {
        LOG_INFO << "Fetching " << source.index_url;
        return fetch_impl(source);
    }

    auto FetchDecoder::fetch_document(const IndexSource& source) -> expected_t<IndexDocument>
    {
        auto content = fetch(source);
        if (!content)
        {
            return forward_error(content);
        }
        return decode_index_document(*content, source.variant);
    }

    /********************
     * HttpFetchDecoder *
     ********************/

    HttpFetchDecoder::HttpFetchDecoder(download::RemoteFetchParams params)
        : m_params(std::move(params))
    {
    }

    auto HttpFetchDecoder::fetch_impl(const IndexSource& source) -> expected_t<std::string>
    {
        auto response = download::fetch({ source.index_url }, m_params);
        if (!response)
        {
            return forward_error(response);
        }
        return check_response(std::move(*response));
    }

    auto check_response(download::Response response) -> expected_t<std::string>
    {
        if (!response.is_success())
        {
            return make_unexpected(
                fmt::format(
                    "Failed to fetch index {}: HTTP {}",
                    response.effective_url,
                    response.http_status
                ),
                nixdata_error_code::fetch_failed
            );
        }
        LOG_DEBUG << "Fetched " << response.content.size() << " bytes from "
                  << response.effective_url;
        return { std::move(response.content) };
    }
}
