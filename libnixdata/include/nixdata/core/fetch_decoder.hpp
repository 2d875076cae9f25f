// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_FETCH_DECODER_HPP
#define NIXDATA_CORE_FETCH_DECODER_HPP

#include <string>

#include "nixdata/core/error_handling.hpp"
#include "nixdata/core/index_document.hpp"
#include "nixdata/core/index_source.hpp"
#include "nixdata/download/fetch.hpp"
#include "nixdata/download/parameters.hpp"

namespace nixdata
{
    /**
     * Download an index and decode it.
     *
     * Subclasses only provide the transfer of the decompressed body.
     */
    class FetchDecoder
    {
    public:

        virtual ~FetchDecoder() = default;

        FetchDecoder(const FetchDecoder&) = delete;
        FetchDecoder& operator=(const FetchDecoder&) = delete;
        FetchDecoder(FetchDecoder&&) = delete;
        FetchDecoder& operator=(FetchDecoder&&) = delete;

        // Decompressed body of ``source.index_url``, errors are ``fetch_failed``.
        [[nodiscard]] auto fetch(const IndexSource& source) -> expected_t<std::string>;

        // Fetch then decode according to ``source.variant``.
        [[nodiscard]] auto fetch_document(const IndexSource& source) -> expected_t<IndexDocument>;

    protected:

        FetchDecoder() = default;

    private:

        virtual auto fetch_impl(const IndexSource& source) -> expected_t<std::string> = 0;
    };

    class HttpFetchDecoder : public FetchDecoder
    {
    public:

        explicit HttpFetchDecoder(download::RemoteFetchParams params);

    private:

        auto fetch_impl(const IndexSource& source) -> expected_t<std::string> override;

        download::RemoteFetchParams m_params;
    };

    // Body of a successful index response, ``fetch_failed`` for any other status.
    [[nodiscard]] auto check_response(download::Response response) -> expected_t<std::string>;
}

#endif
