// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBNIXDATATESTS_HPP
#define LIBNIXDATATESTS_HPP

#include <map>
#include <optional>
#include <string>

#include "nixdata/fs/filesystem.hpp"
#include "nixdata/util/environment.hpp"

namespace nixdatatests
{

#ifndef NIXDATA_TEST_DATA_DIR
#error "NIXDATA_TEST_DATA_DIR must be defined pointing to test data"
#endif
    inline static const nixdata::fs::path test_data_dir = NIXDATA_TEST_DATA_DIR;

    // Restore the given environment variables on destruction.
    class EnvironmentCleaner
    {
    public:

        template <typename... Keys>
        explicit EnvironmentCleaner(const Keys&... keys)
        {
            (m_env.emplace(keys, nixdata::util::get_env(keys)), ...);
        }

        ~EnvironmentCleaner()
        {
            for (const auto& [key, value] : m_env)
            {
                if (value)
                {
                    nixdata::util::set_env(key, *value);
                }
                else
                {
                    nixdata::util::unset_env(key);
                }
            }
        }

        EnvironmentCleaner(const EnvironmentCleaner&) = delete;
        EnvironmentCleaner& operator=(const EnvironmentCleaner&) = delete;

    private:

        std::map<std::string, std::optional<std::string>> m_env;
    };
}

#endif
