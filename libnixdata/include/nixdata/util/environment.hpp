// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_UTIL_ENVIRONMENT_HPP
#define NIXDATA_UTIL_ENVIRONMENT_HPP

#include <optional>
#include <string>
#include <string_view>

#include "nixdata/fs/filesystem.hpp"

namespace nixdata::util
{
    /**
     * Get an environment variable.
     */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    /**
     * Set an environment variable.
     */
    void set_env(const std::string& key, const std::string& value);

    /**
     * Unset an environment variable.
     */
    void unset_env(const std::string& key);

    /**
     * Return the user home directory.
     */
    [[nodiscard]] auto user_home_dir() -> std::string;

    /**
     * Return the current user cache directory.
     *
     * This is ``XDG_CACHE_HOME`` when set, and ``$HOME/.cache`` otherwise.
     */
    [[nodiscard]] auto user_cache_dir() -> fs::path;

    /**
     * Return the full path of a program from PATH value.
     *
     * @return The empty path if the program could not be found.
     */
    [[nodiscard]] auto which(std::string_view exe) -> fs::path;
}
#endif
