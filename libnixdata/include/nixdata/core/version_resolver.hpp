// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_VERSION_RESOLVER_HPP
#define NIXDATA_CORE_VERSION_RESOLVER_HPP

#include <string>
#include <string_view>

#include "nixdata/core/context.hpp"
#include "nixdata/core/error_handling.hpp"
#include "nixdata/core/index_source.hpp"
#include "nixdata/download/parameters.hpp"

namespace nixdata
{
    /**
     * Find the current remote version of an index source.
     */
    class VersionResolver
    {
    public:

        virtual ~VersionResolver() = default;

        VersionResolver(const VersionResolver&) = delete;
        VersionResolver& operator=(const VersionResolver&) = delete;
        VersionResolver(VersionResolver&&) = delete;
        VersionResolver& operator=(VersionResolver&&) = delete;

        // Blocking, errors are ``resolve_failed``.
        [[nodiscard]] auto resolve(const IndexSource& source) -> expected_t<std::string>;

    protected:

        VersionResolver() = default;

    private:

        virtual auto resolve_impl(const IndexSource& source) -> expected_t<std::string> = 0;
    };

    /**
     * Follow the redirections of ``IndexSource::version_url`` and read the version from
     * the final location.
     */
    class ChannelVersionResolver : public VersionResolver
    {
    public:

        explicit ChannelVersionResolver(download::RemoteFetchParams params);

    private:

        auto resolve_impl(const IndexSource& source) -> expected_t<std::string> override;

        download::RemoteFetchParams m_params;
    };

    /**
     * Take the last path segment of ``url`` and remove ``prefix`` from it.
     *
     * ``https://releases.nixos.org/nixos/23.05/nixos-23.05.1234.abcd`` with the prefix
     * ``nixos-`` gives ``23.05.1234.abcd``.
     */
    [[nodiscard]] auto version_from_url(const std::string& url, std::string_view prefix)
        -> expected_t<std::string>;

    /**
     * Release of the running system, normalized with ``normalize_release``.
     */
    [[nodiscard]] auto local_release(const SystemParams& params) -> expected_t<std::string>;
}

#endif
