// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "nixdata/api/resolve.hpp"
#include "nixdata/core/attribute_collector.hpp"
#include "nixdata/core/bulk_loader.hpp"
#include "nixdata/core/cache_manager.hpp"
#include "nixdata/core/fetch_decoder.hpp"
#include "nixdata/core/output.hpp"
#include "nixdata/core/version_resolver.hpp"

namespace nixdata
{
    auto to_string(SourceSelector selector) -> std::string_view
    {
        switch (selector)
        {
            case SourceSelector::system:
                return "system";
            case SourceSelector::legacy:
                return "legacy";
            case SourceSelector::flake:
                return "flake";
        }
        return "";
    }

    auto source_selector_from_string(std::string_view name) -> std::optional<SourceSelector>
    {
        for (auto selector : { SourceSelector::system, SourceSelector::legacy, SourceSelector::flake })
        {
            if (to_string(selector) == name)
            {
                return selector;
            }
        }
        return std::nullopt;
    }

    auto make_source(const Context& ctx, SourceSelector selector) -> expected_t<IndexSource>
    {
        if (selector == SourceSelector::flake)
        {
            return flake_source(ctx.system_params);
        }

        auto release = local_release(ctx.system_params);
        if (!release)
        {
            return forward_error(release);
        }
        if (selector == SourceSelector::system)
        {
            return system_source(ctx.system_params, *release);
        }
        return legacy_source(ctx.system_params, "nixos-" + *release);
    }

    auto ensure_source(const Context& ctx, const IndexSource& source) -> expected_t<fs::path>
    {
        auto resolver = ChannelVersionResolver(ctx.remote_fetch_params);
        auto fetcher = HttpFetchDecoder(ctx.remote_fetch_params);
        auto loader = make_bulk_loader(ctx.bulk_load_params);
        auto manager = CacheManager(ctx.cache_params, resolver, fetcher, *loader);
        return manager.ensure(source);
    }

    auto ensure_store(const Context& ctx, SourceSelector selector) -> expected_t<fs::path>
    {
        return make_source(ctx, selector).and_then([&](const IndexSource& source)
                                                   { return ensure_source(ctx, source); });
    }

    auto ensure_document(const Context& ctx) -> expected_t<fs::path>
    {
        auto release = local_release(ctx.system_params);
        if (!release)
        {
            return forward_error(release);
        }
        return ensure_source(ctx, options_source(ctx.system_params, *release));
    }

    auto resolve_versions(
        const Context& ctx,
        const IndexSource& source,
        const std::vector<fs::path>& declaration_paths
    ) -> expected_t<VersionMap>
    {
        auto reader = NixListReader();
        const auto identifiers = AttributeCollector(reader).collect(declaration_paths);

        auto store = ensure_source(ctx, source);
        if (!store)
        {
            return forward_error(store);
        }

        try
        {
            auto query = QueryResolver(*store);
            auto versions = query.resolve(identifiers);
            if (versions)
            {
                LOG_DEBUG << query.stats().dropped << " declared identifiers not found in "
                          << source.name;
            }
            return versions;
        }
        catch (const nixdata_error& e)
        {
            return tl::make_unexpected(e);
        }
    }

    auto resolve_versions(
        const Context& ctx,
        SourceSelector selector,
        const std::vector<fs::path>& declaration_paths
    ) -> expected_t<VersionMap>
    {
        auto source = make_source(ctx, selector);
        if (!source)
        {
            return forward_error(source);
        }
        return resolve_versions(ctx, *source, declaration_paths);
    }
}
