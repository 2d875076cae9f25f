// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_CACHE_MANAGER_HPP
#define NIXDATA_CORE_CACHE_MANAGER_HPP

#include <optional>
#include <string>

#include "nixdata/core/bulk_loader.hpp"
#include "nixdata/core/context.hpp"
#include "nixdata/core/error_handling.hpp"
#include "nixdata/core/fetch_decoder.hpp"
#include "nixdata/core/index_source.hpp"
#include "nixdata/core/version_resolver.hpp"
#include "nixdata/fs/filesystem.hpp"

namespace nixdata
{
    /**
     * On-disk state of one cache artifact.
     */
    struct CacheManifest
    {
        fs::path artifact_path;
        fs::path marker_path;
        // Content of the marker, if it could be read
        std::optional<std::string> version;

        [[nodiscard]] static auto read(const fs::path& cache_dir, const IndexSource& source)
            -> CacheManifest;

        // The marker holds exactly ``remote_version`` and the artifact exists.
        [[nodiscard]] auto is_fresh(const std::string& remote_version) const -> bool;
    };

    /**
     * Keep the artifacts of the cache directory in sync with their remote indexes.
     *
     * A cycle holds the ``<name>.lock`` advisory lock of the artifact for its whole
     * duration, then runs resolve, freshness check, and only when stale fetch, rebuild
     * and marker write, in that order. Nothing is retried.
     */
    class CacheManager
    {
    public:

        CacheManager(
            CacheParams params,
            VersionResolver& resolver,
            FetchDecoder& fetcher,
            BulkLoader& loader
        );

        /**
         * Return the path of a fresh artifact for ``source``, rebuilding it if needed.
         *
         * Raw sources are stored as the decompressed document, other sources as a store.
         */
        [[nodiscard]] auto ensure(const IndexSource& source) -> expected_t<fs::path>;

        [[nodiscard]] auto manifest(const IndexSource& source) const -> CacheManifest;

        [[nodiscard]] auto cache_dir() const -> const fs::path&;

    private:

        auto rebuild(const IndexSource& source, const CacheManifest& manifest)
            -> expected_t<void>;

        CacheParams m_params;
        VersionResolver& m_resolver;
        FetchDecoder& m_fetcher;
        BulkLoader& m_loader;
    };
}

#endif
