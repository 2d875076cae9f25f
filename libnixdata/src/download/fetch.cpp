// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>
#include <optional>
#include <string_view>

#include <fmt/format.h>

#include "nixdata/core/output.hpp"
#include "nixdata/download/fetch.hpp"
#include "nixdata/util/string.hpp"

#include "compression.hpp"
#include "curl.hpp"

namespace nixdata::download
{
    namespace
    {
        struct TransferState
        {
            const std::string& url;
            CURLHandle& handle;
            Response& response;
            std::string content_encoding = {};
            std::unique_ptr<CompressionStream> stream = nullptr;
            std::optional<std::string> error = std::nullopt;
        };

        size_t header_callback(char* buffer, size_t size, size_t nitems, void* self)
        {
            auto* state = static_cast<TransferState*>(self);
            const auto line = std::string_view(buffer, size * nitems);
            // Every redirect hop starts a new set of headers
            if (util::starts_with(line, "HTTP/"))
            {
                state->content_encoding.clear();
            }
            else if (const auto colon = line.find(':'); colon != std::string_view::npos)
            {
                if (util::to_lower(util::strip(line.substr(0, colon))) == "content-encoding")
                {
                    state->content_encoding = std::string(util::strip(line.substr(colon + 1)));
                }
            }
            return size * nitems;
        }

        auto make_stream(TransferState& state) -> std::unique_ptr<CompressionStream>
        {
            auto writer = [&state](char* in, size_t n) -> size_t
            {
                state.response.content.append(in, n);
                return n;
            };
            const long status = state.handle.get_info<long>(CURLINFO_RESPONSE_CODE).value_or(0);
            if (status >= 400)
            {
                // Error pages are kept verbatim for diagnostics
                return make_compression_stream("", "", std::move(writer));
            }
            return make_compression_stream(state.url, state.content_encoding, std::move(writer));
        }

        size_t write_callback(char* ptr, size_t size, size_t nmemb, void* self)
        {
            auto* state = static_cast<TransferState*>(self);
            try
            {
                if (!state->stream)
                {
                    state->stream = make_stream(*state);
                    if (!state->stream)
                    {
                        state->error = fmt::format(
                            R"(Unsupported content encoding "{}")",
                            state->content_encoding
                        );
                        return 0;
                    }
                }
                return state->stream->write(ptr, size * nmemb);
            }
            catch (const std::exception& e)
            {
                state->error = e.what();
                return 0;
            }
        }

        auto perform_transfer(const Request& request, const RemoteFetchParams& params, bool nobody)
            -> expected_t<Response>
        {
            auto response = Response();
            try
            {
                CURLHandle handle;
                handle.configure_handle(request.url, params);
                // Decoding is done by the compression streams
                handle.set_opt(CURLOPT_HTTP_CONTENT_DECODING, 0L);
                handle.add_header("Accept-Encoding: br, zstd, identity").set_opt_header();
                handle.set_opt(CURLOPT_NOBODY, nobody);

                auto state = TransferState{ request.url, handle, response };
                handle.set_opt(CURLOPT_HEADERFUNCTION, &header_callback);
                handle.set_opt(CURLOPT_HEADERDATA, static_cast<void*>(&state));
                handle.set_opt(CURLOPT_WRITEFUNCTION, &write_callback);
                handle.set_opt(CURLOPT_WRITEDATA, static_cast<void*>(&state));

                LOG_DEBUG << (nobody ? "Resolving " : "Downloading ") << request.url;
                const CURLcode res = handle.perform();
                if (state.error)
                {
                    return make_unexpected(
                        fmt::format("Failed to decode {}: {}", request.url, *state.error),
                        nixdata_error_code::fetch_failed
                    );
                }
                if (res != CURLE_OK)
                {
                    const std::string detail = handle.get_error_buffer()[0] != '\0'
                                                   ? handle.get_error_buffer()
                                                   : CURLHandle::get_res_error(res);
                    return make_unexpected(
                        fmt::format("Transfer of {} failed: {}", request.url, detail),
                        nixdata_error_code::fetch_failed
                    );
                }

                response.http_status = handle.get_info<long>(CURLINFO_RESPONSE_CODE).value_or(0);
                response.effective_url = handle.get_curl_effective_url();
                if (state.stream && response.is_success() && !state.stream->is_complete())
                {
                    return make_unexpected(
                        fmt::format("Compressed content of {} is truncated", request.url),
                        nixdata_error_code::fetch_failed
                    );
                }
            }
            catch (const curl_error& e)
            {
                return make_unexpected(
                    fmt::format("Could not set up transfer of {}: {}", request.url, e.what()),
                    nixdata_error_code::fetch_failed
                );
            }
            return { std::move(response) };
        }
    }

    auto Response::is_success() const -> bool
    {
        if (http_status == 0)
        {
            return util::starts_with(effective_url, "file://");
        }
        return http_status >= 200 && http_status < 300;
    }

    auto fetch(const Request& request, const RemoteFetchParams& params) -> expected_t<Response>
    {
        auto response = perform_transfer(request, params, request.headers_only);
        if (request.headers_only && response && response->http_status == 405)
        {
            // Some servers don't support HEAD, try a GET if the HEAD fails
            LOG_DEBUG << "HEAD not allowed on " << request.url << ", retrying with GET";
            response = perform_transfer(request, params, false);
            if (response)
            {
                response->content.clear();
            }
        }
        return response;
    }
}
