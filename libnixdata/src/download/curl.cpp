// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <new>

#include "nixdata/core/output.hpp"
#include "nixdata/fs/filesystem.hpp"
#include "nixdata/util/environment.hpp"

#include "curl.hpp"

namespace nixdata::download
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }

    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle()
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        // Set error buffer
        std::fill(m_errorbuffer.begin(), m_errorbuffer.end(), '\0');
        set_opt(CURLOPT_ERRORBUFFER, m_errorbuffer.data());
    }

    CURLHandle::CURLHandle(CURLHandle&& rhs)
        : m_handle(rhs.m_handle)
        , p_headers(rhs.p_headers)
    {
        rhs.m_handle = nullptr;
        rhs.p_headers = nullptr;
        std::fill(m_errorbuffer.begin(), m_errorbuffer.end(), '\0');
        std::swap(m_errorbuffer, rhs.m_errorbuffer);
        set_opt(CURLOPT_ERRORBUFFER, m_errorbuffer.data());
    }

    CURLHandle& CURLHandle::operator=(CURLHandle&& rhs)
    {
        using std::swap;
        swap(m_handle, rhs.m_handle);
        swap(p_headers, rhs.p_headers);
        swap(m_errorbuffer, rhs.m_errorbuffer);
        set_opt(CURLOPT_ERRORBUFFER, m_errorbuffer.data());
        if (rhs.m_handle != nullptr)
        {
            rhs.set_opt(CURLOPT_ERRORBUFFER, rhs.m_errorbuffer.data());
        }
        return *this;
    }

    CURLHandle::~CURLHandle()
    {
        curl_easy_cleanup(m_handle);
        curl_slist_free_all(p_headers);
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
        {
            return tl::unexpected(result);
        }
        return val;
    }

    // WARNING curl_easy_getinfo MUST have its third argument pointing to long,
    // curl_off_t, char*, double, curl_slist*, curl_certinfo*, curl_tlssessioninfo*
    // or curl_socket_t depending on the used option.
    template tl::expected<long, CURLcode> CURLHandle::get_info(CURLINFO option) const;
    template tl::expected<char*, CURLcode> CURLHandle::get_info(CURLINFO option) const;

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        auto res = get_info<char*>(option);
        if (res)
        {
            return res.value() ? std::string(res.value()) : std::string();
        }
        else
        {
            return tl::unexpected(res.error());
        }
    }

    void CURLHandle::configure_handle(const std::string& url, const RemoteFetchParams& params)
    {
        set_opt(CURLOPT_URL, url);
        set_opt(CURLOPT_NETRC, static_cast<long>(CURL_NETRC_OPTIONAL));
        set_opt(CURLOPT_FOLLOWLOCATION, 1L);
        set_opt(CURLOPT_MAXREDIRS, 20L);

        // if NETRC is exported in ENV, we forward it to curl
        std::string netrc_file = util::get_env("NETRC").value_or("");
        if (netrc_file != "")
        {
            set_opt(CURLOPT_NETRC_FILE, netrc_file);
        }

        // This can improve throughput significantly, see
        // https://github.com/curl/curl/issues/9601
        set_opt(CURLOPT_BUFFERSIZE, 100L * 1024L);

        set_opt(CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_1_1));

        // A stalled transfer is aborted after one minute below 30 bytes/s
        set_opt(CURLOPT_LOW_SPEED_TIME, 60L);
        set_opt(CURLOPT_LOW_SPEED_LIMIT, 30L);

        set_opt(
            CURLOPT_CONNECTTIMEOUT_MS,
            static_cast<long>(params.connect_timeout_secs * 1000.)
        );
        if (params.transfer_timeout_secs > 0)
        {
            set_opt(CURLOPT_TIMEOUT, params.transfer_timeout_secs);
        }

        if (!params.user_agent.empty())
        {
            set_opt(CURLOPT_USERAGENT, params.user_agent);
        }

        if (params.proxy)
        {
            set_opt(CURLOPT_PROXY, *params.proxy);
            LOG_INFO << "Using Proxy " << *params.proxy;
        }

        const auto& ssl_verify = params.ssl_verify;
        if (ssl_verify.size())
        {
            if (ssl_verify == "<false>")
            {
                set_opt(CURLOPT_SSL_VERIFYPEER, 0L);
                set_opt(CURLOPT_SSL_VERIFYHOST, 0L);
                if (params.proxy)
                {
                    set_opt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
                    set_opt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
                }
            }
            else if (ssl_verify != "<system>")
            {
                if (!fs::exists(ssl_verify))
                {
                    throw curl_error("ssl_verify does not contain a valid file path.");
                }
                set_opt(CURLOPT_CAINFO, ssl_verify);
                if (params.proxy)
                {
                    set_opt(CURLOPT_PROXY_CAINFO, ssl_verify);
                }
            }
        }
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::set_opt_header()
    {
        set_opt(CURLOPT_HTTPHEADER, p_headers);
        return *this;
    }

    const char* CURLHandle::get_error_buffer() const
    {
        return m_errorbuffer.data();
    }

    std::string CURLHandle::get_curl_effective_url() const
    {
        return get_info<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    CURLcode CURLHandle::perform()
    {
        return curl_easy_perform(m_handle);
    }

    std::string CURLHandle::get_res_error(CURLcode res)
    {
        return static_cast<std::string>(curl_easy_strerror(res));
    }
}
