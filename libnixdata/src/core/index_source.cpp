// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "nixdata/core/index_source.hpp"
#include "nixdata/util/string.hpp"

namespace nixdata
{
    namespace
    {
        auto channel_url(const SystemParams& params, std::string_view channel) -> std::string
        {
            return fmt::format("{}/{}", util::rstrip(params.channels_url, "/"), channel);
        }

        // ``nixos-23.05`` and ``nixpkgs-unstable`` have the prefixes ``nixos-`` and ``nixpkgs-``
        auto channel_prefix(std::string_view channel) -> std::string
        {
            const auto pos = channel.find('-');
            return pos == std::string_view::npos ? std::string() : std::string(channel.substr(0, pos + 1));
        }

        auto channel_source(
            const SystemParams& params,
            std::string name,
            IndexVariant variant,
            std::string_view channel,
            std::string_view document
        ) -> IndexSource
        {
            const auto url = channel_url(params, channel);
            return {
                /* .name= */ std::move(name),
                /* .variant= */ variant,
                /* .version_url= */ url,
                /* .index_url= */ fmt::format("{}/{}", url, document),
                /* .version_prefix= */ channel_prefix(channel),
            };
        }
    }

    auto IndexSource::artifact_filename() const -> std::string
    {
        return name + (variant == IndexVariant::raw ? ".json" : ".db");
    }

    auto IndexSource::marker_filename() const -> std::string
    {
        return name + ".ver";
    }

    auto IndexSource::lock_filename() const -> std::string
    {
        return name + ".lock";
    }

    auto normalize_release(std::string_view raw, std::string_view rolling_release) -> std::string
    {
        const auto release = util::strip(raw).substr(0, 5);
        if (release == rolling_release)
        {
            return "unstable";
        }
        return std::string(release);
    }

    auto system_source(const SystemParams& params, std::string_view release) -> IndexSource
    {
        return channel_source(
            params,
            "nixospkgs",
            IndexVariant::extended,
            fmt::format("nixos-{}", release),
            "packages.json.br"
        );
    }

    auto legacy_source(const SystemParams& params, std::string_view channel) -> IndexSource
    {
        return channel_source(params, "legacypkgs", IndexVariant::plain, channel, "packages.json.br");
    }

    auto flake_source(const SystemParams& params, std::string_view channel) -> IndexSource
    {
        return channel_source(params, "flakespkgs", IndexVariant::plain, channel, "packages.json.br");
    }

    auto options_source(const SystemParams& params, std::string_view release) -> IndexSource
    {
        return channel_source(
            params,
            "nixosoptions",
            IndexVariant::raw,
            fmt::format("nixos-{}", release),
            "options.json.br"
        );
    }
}
