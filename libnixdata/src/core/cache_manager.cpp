// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <system_error>

#include <fmt/format.h>

#include "nixdata/core/cache_manager.hpp"
#include "nixdata/core/output.hpp"
#include "nixdata/core/store_builder.hpp"
#include "nixdata/core/util.hpp"

namespace nixdata
{
    /*****************
     * CacheManifest *
     *****************/

    auto CacheManifest::read(const fs::path& cache_dir, const IndexSource& source) -> CacheManifest
    {
        CacheManifest manifest{
            /* .artifact_path= */ cache_dir / source.artifact_filename(),
            /* .marker_path= */ cache_dir / source.marker_filename(),
            /* .version= */ std::nullopt,
        };
        std::error_code ec;
        if (fs::is_regular_file(manifest.marker_path, ec))
        {
            try
            {
                manifest.version = read_contents(manifest.marker_path);
            }
            catch (const std::system_error& e)
            {
                LOG_DEBUG << "Could not read marker " << manifest.marker_path << ": " << e.what();
            }
        }
        return manifest;
    }

    auto CacheManifest::is_fresh(const std::string& remote_version) const -> bool
    {
        std::error_code ec;
        return version.has_value() && *version == remote_version
               && fs::exists(artifact_path, ec);
    }

    /****************
     * CacheManager *
     ****************/

    CacheManager::CacheManager(
        CacheParams params,
        VersionResolver& resolver,
        FetchDecoder& fetcher,
        BulkLoader& loader
    )
        : m_params(std::move(params))
        , m_resolver(resolver)
        , m_fetcher(fetcher)
        , m_loader(loader)
    {
    }

    auto CacheManager::cache_dir() const -> const fs::path&
    {
        return m_params.cache_dir;
    }

    auto CacheManager::manifest(const IndexSource& source) const -> CacheManifest
    {
        return CacheManifest::read(m_params.cache_dir, source);
    }

    auto CacheManager::ensure(const IndexSource& source) -> expected_t<fs::path>
    {
        std::error_code ec;
        fs::create_directories(m_params.cache_dir, ec);
        if (ec)
        {
            return make_unexpected(
                fmt::format(
                    "Could not create cache directory {}: {}",
                    m_params.cache_dir.string(),
                    ec.message()
                ),
                nixdata_error_code::store_failed
            );
        }

        auto lock = LockFile::acquire(
            m_params.cache_dir / source.lock_filename(),
            m_params.lock_timeout
        );
        if (!lock)
        {
            return forward_error(lock);
        }

        auto remote_version = m_resolver.resolve(source);
        if (!remote_version)
        {
            return forward_error(remote_version);
        }

        const auto current = manifest(source);
        if (current.is_fresh(*remote_version))
        {
            LOG_DEBUG << "No new version of " << source.name << " found";
            return { current.artifact_path };
        }

        LOG_INFO << "Updating " << source.name << " from "
                 << current.version.value_or("<none>") << " to " << *remote_version;
        if (auto rebuilt = rebuild(source, current); !rebuilt)
        {
            return forward_error(rebuilt);
        }

        // Written last, a failed cycle leaves the previous marker in place
        try
        {
            write_contents_atomic(current.marker_path, *remote_version);
        }
        catch (const std::exception& e)
        {
            return make_unexpected(
                fmt::format("Could not write marker {}: {}", current.marker_path.string(), e.what()),
                nixdata_error_code::store_failed
            );
        }
        return { current.artifact_path };
    }

    auto CacheManager::rebuild(const IndexSource& source, const CacheManifest& manifest)
        -> expected_t<void>
    {
        if (source.variant == IndexVariant::raw)
        {
            auto content = m_fetcher.fetch(source);
            if (!content)
            {
                return forward_error(content);
            }
            try
            {
                write_contents_atomic(manifest.artifact_path, *content);
            }
            catch (const std::exception& e)
            {
                return make_unexpected(
                    fmt::format(
                        "Could not write document {}: {}",
                        manifest.artifact_path.string(),
                        e.what()
                    ),
                    nixdata_error_code::store_failed
                );
            }
            return {};
        }

        auto doc = m_fetcher.fetch_document(source);
        if (!doc)
        {
            return forward_error(doc);
        }
        auto stats = StoreBuilder(m_loader).build(*doc, manifest.artifact_path);
        if (!stats)
        {
            return forward_error(stats);
        }
        return {};
    }
}
