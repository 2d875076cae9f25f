// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <fmt/format.h>
#include <pwd.h>
#include <unistd.h>

#include "nixdata/util/environment.hpp"
#include "nixdata/util/string.hpp"

namespace nixdata::util
{
    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        if (const char* val = std::getenv(key.c_str()))
        {
            return { val };
        }
        return std::nullopt;
    }

    void set_env(const std::string& key, const std::string& value)
    {
        const auto res = ::setenv(key.c_str(), value.c_str(), 1);
        if (res != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not set environment variable "{}": {})", key, std::strerror(errno))
            );
        }
    }

    void unset_env(const std::string& key)
    {
        const auto res = ::unsetenv(key.c_str());
        if (res != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not unset environment variable "{}": {})", key, std::strerror(errno))
            );
        }
    }

    auto user_home_dir() -> std::string
    {
        if (auto maybe_home = get_env("HOME"); maybe_home && !maybe_home->empty())
        {
            return std::move(maybe_home).value();
        }
        const auto* user = ::getpwuid(::getuid());
        if (user == nullptr || user->pw_dir == nullptr)
        {
            throw std::runtime_error("HOME not set and user home directory unknown.");
        }
        return { user->pw_dir };
    }

    auto user_cache_dir() -> fs::path
    {
        if (auto maybe_dir = get_env("XDG_CACHE_HOME"); maybe_dir && !maybe_dir->empty())
        {
            return { std::move(maybe_dir).value() };
        }
        return fs::path(user_home_dir()) / ".cache";
    }

    auto which(std::string_view exe) -> fs::path
    {
        if (exe.find('/') != std::string_view::npos)
        {
            std::error_code ec;
            const auto candidate = fs::path(exe);
            return fs::exists(candidate, ec) ? candidate : fs::path();
        }
        const auto path = get_env("PATH").value_or("");
        for (const auto& dir : split(path, ":"))
        {
            if (dir.empty())
            {
                continue;
            }
            const auto candidate = fs::path(dir) / exe;
            if (::access(candidate.c_str(), X_OK) == 0)
            {
                return candidate;
            }
        }
        return {};
    }
}
