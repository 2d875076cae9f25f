// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "nixdata/core/context.hpp"
#include "nixdata/util/environment.hpp"
#include "nixdata/util/string.hpp"

namespace nixdata
{
    namespace
    {
        template <class T>
        void read_key(const YAML::Node& root, const char* key, T& value)
        {
            if (const auto node = root[key]; node && !node.IsNull())
            {
                value = node.as<T>();
            }
        }

        auto parse_log_level(const std::string& name) -> log_level
        {
            if (auto level = log_level_from_string(name))
            {
                return *level;
            }
            throw std::invalid_argument(fmt::format(R"(Unknown log level "{}")", name));
        }

        auto parse_bulk_loader(const std::string& name) -> BulkLoaderKind
        {
            const auto lowered = util::to_lower(util::strip(name));
            if (lowered == "in_process" || lowered == "in-process")
            {
                return BulkLoaderKind::in_process;
            }
            if (lowered == "sqlite3")
            {
                return BulkLoaderKind::sqlite3;
            }
            throw std::invalid_argument(fmt::format(R"(Unknown bulk loader "{}")", name));
        }

        void read_config_file(Context& ctx, const fs::path& config_file)
        {
            const YAML::Node root = YAML::LoadFile(config_file.string());
            if (!root.IsMap())
            {
                if (root.IsNull())
                {
                    return;
                }
                throw std::invalid_argument("top-level node is not a mapping");
            }

            std::string cache_dir;
            read_key(root, "cache_dir", cache_dir);
            if (!cache_dir.empty())
            {
                ctx.cache_params.cache_dir = cache_dir;
            }

            long lock_timeout = ctx.cache_params.lock_timeout.count();
            read_key(root, "lock_timeout", lock_timeout);
            ctx.cache_params.lock_timeout = std::chrono::seconds(lock_timeout);

            read_key(root, "connect_timeout", ctx.remote_fetch_params.connect_timeout_secs);
            read_key(root, "transfer_timeout", ctx.remote_fetch_params.transfer_timeout_secs);
            read_key(root, "ssl_verify", ctx.remote_fetch_params.ssl_verify);

            std::string proxy;
            read_key(root, "proxy", proxy);
            if (!proxy.empty())
            {
                ctx.remote_fetch_params.proxy = proxy;
            }

            read_key(root, "channels_url", ctx.system_params.channels_url);
            read_key(root, "rolling_release", ctx.system_params.rolling_release);
            read_key(root, "sqlite3_executable", ctx.bulk_load_params.sqlite3_executable);

            std::string loader;
            read_key(root, "bulk_loader", loader);
            if (!loader.empty())
            {
                ctx.bulk_load_params.loader = parse_bulk_loader(loader);
            }

            std::string level;
            read_key(root, "log_level", level);
            if (!level.empty())
            {
                ctx.logging_params.level = parse_log_level(level);
            }
        }
    }

    Context::Context()
        : cache_params{ default_cache_dir() }
    {
    }

    fs::path Context::default_cache_dir()
    {
        return util::user_cache_dir() / "nix-data";
    }

    void apply_env_overrides(Context& ctx)
    {
        if (auto dir = util::get_env("NIXDATA_CACHE_DIR"); dir && !dir->empty())
        {
            ctx.cache_params.cache_dir = *dir;
        }
        if (auto level = util::get_env("NIXDATA_LOG_LEVEL"); level && !level->empty())
        {
            if (auto parsed = log_level_from_string(*level))
            {
                ctx.logging_params.level = *parsed;
            }
            else
            {
                LOG_WARNING << "Ignoring invalid NIXDATA_LOG_LEVEL '" << *level << "'";
            }
        }
    }

    auto load_context(const fs::path& config_file) -> expected_t<Context>
    {
        auto ctx = Context();
        if (!config_file.empty())
        {
            try
            {
                read_config_file(ctx, config_file);
            }
            catch (const YAML::Exception& e)
            {
                return make_unexpected(
                    fmt::format(
                        "YAML error while reading configuration '{}': {}",
                        config_file.string(),
                        e.what()
                    ),
                    nixdata_error_code::configuration_invalid
                );
            }
            catch (const std::invalid_argument& e)
            {
                return make_unexpected(
                    fmt::format("Invalid configuration '{}': {}", config_file.string(), e.what()),
                    nixdata_error_code::configuration_invalid
                );
            }
        }
        apply_env_overrides(ctx);
        return { std::move(ctx) };
    }
}
