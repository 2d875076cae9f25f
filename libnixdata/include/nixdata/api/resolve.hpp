// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_API_RESOLVE_HPP
#define NIXDATA_API_RESOLVE_HPP

#include <optional>
#include <string_view>
#include <vector>

#include "nixdata/core/context.hpp"
#include "nixdata/core/error_handling.hpp"
#include "nixdata/core/index_source.hpp"
#include "nixdata/core/query_resolver.hpp"
#include "nixdata/fs/filesystem.hpp"

namespace nixdata
{
    enum class SourceSelector
    {
        system,
        legacy,
        flake
    };

    [[nodiscard]] auto to_string(SourceSelector selector) -> std::string_view;
    [[nodiscard]] auto source_selector_from_string(std::string_view name)
        -> std::optional<SourceSelector>;

    /**
     * Build the index source of a selector.
     *
     * The system and legacy sources need the local release, found by running
     * ``SystemParams::release_command``.
     */
    [[nodiscard]] auto make_source(const Context& ctx, SourceSelector selector)
        -> expected_t<IndexSource>;

    /**
     * Make sure the store of the selected source is fresh and return its path.
     */
    [[nodiscard]] auto ensure_store(const Context& ctx, SourceSelector selector)
        -> expected_t<fs::path>;

    /**
     * Make sure a store or document is fresh for an already built source.
     */
    [[nodiscard]] auto ensure_source(const Context& ctx, const IndexSource& source)
        -> expected_t<fs::path>;

    /**
     * Make sure the NixOS options document of the local release is fresh and return its
     * path.
     */
    [[nodiscard]] auto ensure_document(const Context& ctx) -> expected_t<fs::path>;

    /**
     * Versions of the packages declared in ``declaration_paths``, as found in the store of
     * the selected source.
     *
     * Unreadable declaration files are skipped and identifiers without exactly one match
     * are left out.
     */
    [[nodiscard]] auto resolve_versions(
        const Context& ctx,
        SourceSelector selector,
        const std::vector<fs::path>& declaration_paths
    ) -> expected_t<VersionMap>;

    [[nodiscard]] auto resolve_versions(
        const Context& ctx,
        const IndexSource& source,
        const std::vector<fs::path>& declaration_paths
    ) -> expected_t<VersionMap>;
}

#endif
