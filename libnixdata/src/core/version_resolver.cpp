// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "nixdata/core/output.hpp"
#include "nixdata/core/version_resolver.hpp"
#include "nixdata/download/fetch.hpp"
#include "nixdata/util/os.hpp"
#include "nixdata/util/string.hpp"
#include "nixdata/util/url.hpp"

namespace nixdata
{
    /*******************
     * VersionResolver *
     *******************/

    auto VersionResolver::resolve(const IndexSource& source) -> expected_t<std::string>
    {
        auto version = resolve_impl(source);
        if (version)
        {
            LOG_INFO << "Latest version of " << source.name << ": " << *version;
        }
        return version;
    }

    /**************************
     * ChannelVersionResolver *
     **************************/

    ChannelVersionResolver::ChannelVersionResolver(download::RemoteFetchParams params)
        : m_params(std::move(params))
    {
    }

    auto ChannelVersionResolver::resolve_impl(const IndexSource& source) -> expected_t<std::string>
    {
        auto response = download::fetch({ source.version_url, /* headers_only= */ true }, m_params);
        if (!response)
        {
            return make_unexpected(
                fmt::format("Could not resolve version of {}: {}", source.name, response.error().what()),
                nixdata_error_code::resolve_failed
            );
        }
        if (!response->is_success())
        {
            return make_unexpected(
                fmt::format(
                    "Could not resolve version of {}: {} answered HTTP {}",
                    source.name,
                    response->effective_url,
                    response->http_status
                ),
                nixdata_error_code::resolve_failed
            );
        }
        LOG_DEBUG << source.version_url << " resolved to " << response->effective_url;
        return version_from_url(response->effective_url, source.version_prefix);
    }

    auto version_from_url(const std::string& url, std::string_view prefix) -> expected_t<std::string>
    {
        auto segments = util::url_path_segments(url);
        if (!segments)
        {
            return make_unexpected(segments.error().message, nixdata_error_code::resolve_failed);
        }
        if (segments->empty())
        {
            return make_unexpected(
                fmt::format(R"(No path segments found in "{}")", url),
                nixdata_error_code::resolve_failed
            );
        }
        auto version = std::string(util::remove_prefix(segments->back(), prefix));
        if (version.empty())
        {
            return make_unexpected(
                fmt::format(R"(No version found in last path segment of "{}")", url),
                nixdata_error_code::resolve_failed
            );
        }
        return { std::move(version) };
    }

    auto local_release(const SystemParams& params) -> expected_t<std::string>
    {
        auto raw = util::nixos_version(params.release_command);
        if (!raw)
        {
            return make_unexpected(raw.error().message, nixdata_error_code::resolve_failed);
        }
        auto release = normalize_release(*raw, params.rolling_release);
        if (release.empty())
        {
            return make_unexpected(
                "Release command printed nothing",
                nixdata_error_code::resolve_failed
            );
        }
        LOG_DEBUG << "Local release: " << release;
        return { std::move(release) };
    }
}
