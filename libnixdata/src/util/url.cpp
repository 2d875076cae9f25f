// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>

#include <curl/urlapi.h>
#include <fmt/format.h>

#include "nixdata/util/string.hpp"
#include "nixdata/util/url.hpp"

namespace nixdata::util
{

    /*******************
     *  CURL wrappers  *
     *******************/

    namespace
    {
        /**
         * A RAII ``CURLU*`` created from ``curl_url``.
         *
         * Never null, throw exception at construction if creating the handle fails.
         */
        class CurlUrl
        {
        public:

            using value_type = ::CURLU;
            using pointer = value_type*;
            using flag_type = unsigned int;

            static auto parse(const std::string& url, flag_type flags = 0)
                -> tl::expected<CurlUrl, ParseError>;

            CurlUrl();

            [[nodiscard]] auto
            get_part(::CURLUPart part, flag_type flags = 0) const -> std::optional<std::string>;

        private:

            struct CurlDeleter
            {
                void operator()(pointer ptr);
            };

            std::unique_ptr<value_type, CurlDeleter> m_handle = nullptr;
        };

        /**
         * A RAII wrapper for string mananged by CURL.
         */
        class CurlStr
        {
        public:

            CurlStr() = default;
            ~CurlStr();

            CurlStr(const CurlStr&) = delete;
            auto operator=(const CurlStr&) -> CurlStr& = delete;

            [[nodiscard]] auto raw_input() -> char**;
            [[nodiscard]] auto str() const -> std::optional<std::string_view>;

        private:

            char* m_data = nullptr;
        };

        auto CurlUrl::parse(const std::string& url, flag_type flags) -> tl::expected<CurlUrl, ParseError>
        {
            auto out = CurlUrl();
            const CURLUcode uc = ::curl_url_set(out.m_handle.get(), CURLUPART_URL, url.c_str(), flags);
            if (uc != CURLUE_OK)
            {
                return tl::make_unexpected(ParseError{
                    fmt::format(R"(Failed to parse URL "{}": {})", url, ::curl_url_strerror(uc)) });
            }
            return { std::move(out) };
        }

        CurlUrl::CurlUrl()
        {
            m_handle.reset(::curl_url());
            if (m_handle == nullptr)
            {
                throw std::runtime_error("Could not create CurlUrl handle");
            }
        }

        void CurlUrl::CurlDeleter::operator()(pointer ptr)
        {
            if (ptr)
            {
                ::curl_url_cleanup(ptr);
            }
        }

        auto CurlUrl::get_part(CURLUPart part, flag_type flags) const -> std::optional<std::string>
        {
            CurlStr value{};
            const auto rc = ::curl_url_get(m_handle.get(), part, value.raw_input(), flags);
            if (!rc)
            {
                if (auto str = value.str())
                {
                    return std::string(*str);
                }
            }
            return std::nullopt;
        }

        CurlStr::~CurlStr()
        {
            ::curl_free(m_data);
            m_data = nullptr;
        }

        auto CurlStr::raw_input() -> char**
        {
            return &m_data;
        }

        auto CurlStr::str() const -> std::optional<std::string_view>
        {
            if (m_data)
            {
                return { { m_data } };
            }
            return std::nullopt;
        }
    }

    auto url_path(const std::string& url) -> tl::expected<std::string, ParseError>
    {
        auto handle = CurlUrl::parse(url, CURLU_NON_SUPPORT_SCHEME);
        if (!handle)
        {
            return tl::make_unexpected(handle.error());
        }
        return handle->get_part(CURLUPART_PATH, CURLU_URLDECODE).value_or("");
    }

    auto url_path_segments(const std::string& url)
        -> tl::expected<std::vector<std::string>, ParseError>
    {
        return url_path(url).map(
            [](const std::string& path)
            {
                std::vector<std::string> segments;
                for (auto& part : split(path, "/"))
                {
                    if (!part.empty())
                    {
                        segments.push_back(std::move(part));
                    }
                }
                return segments;
            }
        );
    }

    auto path_to_url(const std::string& path) -> std::string
    {
        if (starts_with(path, "file://"))
        {
            return path;
        }
        return "file://" + path;
    }
}
