// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_DL_CURL_HPP
#define NIXDATA_DL_CURL_HPP

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

extern "C"
{
#include <curl/curl.h>
}

#include <fmt/core.h>
#include <tl/expected.hpp>

#include "nixdata/download/parameters.hpp"

namespace nixdata::download
{
    class curl_error : public std::runtime_error
    {
    public:

        curl_error(const std::string& what = "");
    };

    class CURLHandle
    {
    public:

        CURLHandle();
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        CURLHandle(CURLHandle&& rhs);
        CURLHandle& operator=(CURLHandle&& rhs);

        template <class T>
        tl::expected<T, CURLcode> get_info(CURLINFO option) const;

        // Apply the options shared by every transfer: redirects, timeouts, proxy and TLS.
        void configure_handle(const std::string& url, const RemoteFetchParams& params);

        CURLHandle& add_header(const std::string& header);
        CURLHandle& set_opt_header();

        template <class T>
        CURLHandle& set_opt(CURLoption opt, const T& val);

        const char* get_error_buffer() const;
        std::string get_curl_effective_url() const;

        CURLcode perform();

        static std::string get_res_error(CURLcode res);

    private:

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        std::array<char, CURL_ERROR_SIZE> m_errorbuffer;
    };

    template <class T>
    CURLHandle& CURLHandle::set_opt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)));
        }
        return *this;
    }

}  // namespace nixdata::download

#endif  // NIXDATA_DL_CURL_HPP
