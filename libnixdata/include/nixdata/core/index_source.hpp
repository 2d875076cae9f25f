// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_INDEX_SOURCE_HPP
#define NIXDATA_CORE_INDEX_SOURCE_HPP

#include <string>
#include <string_view>

#include "nixdata/core/context.hpp"

namespace nixdata
{
    enum class IndexVariant
    {
        // pkgs with a system column, and a meta table
        extended,
        // pkgs with attribute, pname and version only
        plain,
        // Document stored verbatim, no relational store
        raw
    };

    /**
     * A remote index and the cache artifact built from it.
     */
    struct IndexSource
    {
        // Stem of the cache files, e.g. ``nixospkgs`` for ``nixospkgs.db``
        std::string name;
        IndexVariant variant = IndexVariant::plain;
        // Redirecting URL whose final path segment names the current version
        std::string version_url;
        std::string index_url;
        // Removed from the final path segment, e.g. ``nixos-``
        std::string version_prefix;

        [[nodiscard]] auto artifact_filename() const -> std::string;
        [[nodiscard]] auto marker_filename() const -> std::string;
        [[nodiscard]] auto lock_filename() const -> std::string;
    };

    /**
     * Map the raw output of the release command to a channel version.
     *
     * Only the first five characters are kept (``23.05.1234.abc`` gives ``23.05``), and the
     * rolling release maps to ``unstable``.
     */
    [[nodiscard]] auto normalize_release(std::string_view raw, std::string_view rolling_release)
        -> std::string;

    /**
     * Extended index of the NixOS channel ``nixos-<release>``.
     */
    [[nodiscard]] auto system_source(const SystemParams& params, std::string_view release)
        -> IndexSource;

    /**
     * Plain index of a legacy channel, ``nixos-<release>`` by default.
     */
    [[nodiscard]] auto legacy_source(const SystemParams& params, std::string_view channel)
        -> IndexSource;

    /**
     * Plain index of the channel tracked by flakes, ``nixpkgs-unstable`` by default.
     */
    [[nodiscard]] auto
    flake_source(const SystemParams& params, std::string_view channel = "nixpkgs-unstable")
        -> IndexSource;

    /**
     * NixOS options document of the channel ``nixos-<release>``, kept as JSON.
     */
    [[nodiscard]] auto options_source(const SystemParams& params, std::string_view release)
        -> IndexSource;
}

#endif
