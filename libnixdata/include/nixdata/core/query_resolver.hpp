// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_QUERY_RESOLVER_HPP
#define NIXDATA_CORE_QUERY_RESOLVER_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "nixdata/core/error_handling.hpp"
#include "nixdata/fs/filesystem.hpp"

namespace nixdata
{
    class SQLiteDatabase;

    using VersionMap = std::map<std::string, std::string>;

    struct QueryStats
    {
        // Identifiers matching zero or several rows during the last resolve
        std::size_t dropped = 0;
    };

    struct StoredPackage
    {
        std::string attribute;
        // Only in extended stores
        std::optional<std::string> system;
        std::string pname;
        std::string version;
    };

    /**
     * Meta row of an extended store, JSON columns are left serialized.
     */
    struct StoredMeta
    {
        std::string attribute;
        bool broken = false;
        bool insecure = false;
        bool unsupported = false;
        bool unfree = false;
        std::string description;
        std::string longdescription;
        std::string homepage;
        std::string maintainers;
        std::string position;
        std::string license;
        std::string platforms;
    };

    /**
     * Read-only lookups in a store built by ``StoreBuilder``.
     */
    class QueryResolver
    {
    public:

        /**
         * Open the store read-only.
         *
         * @throw nixdata_error with ``store_failed`` if the store cannot be opened.
         */
        explicit QueryResolver(const fs::path& store);
        ~QueryResolver();

        QueryResolver(const QueryResolver&) = delete;
        QueryResolver& operator=(const QueryResolver&) = delete;
        QueryResolver(QueryResolver&&) noexcept;
        QueryResolver& operator=(QueryResolver&&) noexcept;

        /**
         * Map each identifier to its version.
         *
         * An identifier is kept only when exactly one row of ``pkgs`` has it as attribute,
         * the others are silently left out and counted in ``stats()``.
         */
        [[nodiscard]] auto resolve(const std::set<std::string>& identifiers)
            -> expected_t<VersionMap>;

        [[nodiscard]] auto package(const std::string& attribute)
            -> expected_t<std::optional<StoredPackage>>;

        // Error if the store has no meta table.
        [[nodiscard]] auto meta(const std::string& attribute)
            -> expected_t<std::optional<StoredMeta>>;

        // Packages sharing a pname, ordered by attribute.
        [[nodiscard]] auto by_pname(const std::string& pname)
            -> expected_t<std::vector<StoredPackage>>;

        [[nodiscard]] auto stats() const -> const QueryStats&;

        [[nodiscard]] auto has_system_column() const -> bool;

    private:

        std::unique_ptr<SQLiteDatabase> p_db;
        QueryStats m_stats;
        bool m_has_system = false;
    };
}

#endif
