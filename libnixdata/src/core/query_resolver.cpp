// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "nixdata/core/output.hpp"
#include "nixdata/core/query_resolver.hpp"

#include "sqlite.hpp"

namespace nixdata
{
    namespace
    {
        auto table_columns(SQLiteDatabase& db, std::string_view table) -> std::set<std::string>
        {
            std::set<std::string> columns;
            auto stmt = db.prepare(fmt::format("PRAGMA table_info({})", quote_identifier(table)));
            while (stmt.step())
            {
                columns.insert(stmt.column_text(1));
            }
            return columns;
        }

        auto package_query(bool has_system) -> std::string
        {
            return has_system ? R"(SELECT "attribute", "system", "pname", "version" FROM "pkgs")"
                              : R"(SELECT "attribute", NULL, "pname", "version" FROM "pkgs")";
        }

        auto read_package(const SQLiteStatement& stmt) -> StoredPackage
        {
            StoredPackage pkg;
            pkg.attribute = stmt.column_text(0);
            if (!stmt.column_is_null(1))
            {
                pkg.system = stmt.column_text(1);
            }
            pkg.pname = stmt.column_text(2);
            pkg.version = stmt.column_text(3);
            return pkg;
        }

        auto query_error(const sqlite_error& e) -> tl::unexpected<nixdata_error>
        {
            return make_unexpected(
                fmt::format("Store query failed: {}", e.what()),
                nixdata_error_code::store_failed
            );
        }
    }

    QueryResolver::QueryResolver(const fs::path& store)
    {
        try
        {
            p_db = std::make_unique<SQLiteDatabase>(store, SQLiteDatabase::OpenMode::read_only);
            const auto columns = table_columns(*p_db, "pkgs");
            if (columns.count("attribute") == 0 || columns.count("version") == 0)
            {
                throw nixdata_error(
                    fmt::format("'{}' is not a package store", store.string()),
                    nixdata_error_code::store_failed
                );
            }
            m_has_system = columns.count("system") != 0;
        }
        catch (const sqlite_error& e)
        {
            throw nixdata_error(e.what(), nixdata_error_code::store_failed);
        }
    }

    QueryResolver::~QueryResolver() = default;
    QueryResolver::QueryResolver(QueryResolver&&) noexcept = default;
    QueryResolver& QueryResolver::operator=(QueryResolver&&) noexcept = default;

    auto QueryResolver::resolve(const std::set<std::string>& identifiers) -> expected_t<VersionMap>
    {
        VersionMap versions;
        m_stats = {};
        try
        {
            auto stmt = p_db->prepare(R"(SELECT "version" FROM "pkgs" WHERE "attribute" = ?)");
            for (const auto& id : identifiers)
            {
                stmt.bind(1, id);
                std::size_t matches = 0;
                std::string version;
                while (stmt.step())
                {
                    if (matches++ == 0)
                    {
                        version = stmt.column_text(0);
                    }
                }
                stmt.reset(true);

                if (matches == 1)
                {
                    versions.emplace(id, std::move(version));
                }
                else
                {
                    LOG_TRACE << "Dropping '" << id << "' with " << matches << " matching rows";
                    ++m_stats.dropped;
                }
            }
        }
        catch (const sqlite_error& e)
        {
            return query_error(e);
        }

        LOG_DEBUG << "Resolved " << versions.size() << " of " << identifiers.size()
                  << " identifiers";
        return { std::move(versions) };
    }

    auto QueryResolver::package(const std::string& attribute)
        -> expected_t<std::optional<StoredPackage>>
    {
        try
        {
            auto stmt = p_db->prepare(package_query(m_has_system) + R"( WHERE "attribute" = ?)");
            stmt.bind(1, attribute);
            if (!stmt.step())
            {
                return { std::nullopt };
            }
            return { read_package(stmt) };
        }
        catch (const sqlite_error& e)
        {
            return query_error(e);
        }
    }

    auto QueryResolver::meta(const std::string& attribute) -> expected_t<std::optional<StoredMeta>>
    {
        try
        {
            auto stmt = p_db->prepare(R"sql(
                SELECT "attribute", "broken", "insecure", "unsupported", "unfree",
                       "description", "longdescription", "homepage", "maintainers",
                       "position", "license", "platforms"
                FROM "meta" WHERE "attribute" = ?
            )sql");
            stmt.bind(1, attribute);
            if (!stmt.step())
            {
                return { std::nullopt };
            }
            StoredMeta meta;
            meta.attribute = stmt.column_text(0);
            meta.broken = stmt.column_int(1) != 0;
            meta.insecure = stmt.column_int(2) != 0;
            meta.unsupported = stmt.column_int(3) != 0;
            meta.unfree = stmt.column_int(4) != 0;
            meta.description = stmt.column_text(5);
            meta.longdescription = stmt.column_text(6);
            meta.homepage = stmt.column_text(7);
            meta.maintainers = stmt.column_text(8);
            meta.position = stmt.column_text(9);
            meta.license = stmt.column_text(10);
            meta.platforms = stmt.column_text(11);
            return { std::move(meta) };
        }
        catch (const sqlite_error& e)
        {
            return query_error(e);
        }
    }

    auto QueryResolver::by_pname(const std::string& pname) -> expected_t<std::vector<StoredPackage>>
    {
        std::vector<StoredPackage> packages;
        try
        {
            auto stmt = p_db->prepare(
                package_query(m_has_system) + R"( WHERE "pname" = ? ORDER BY "attribute")"
            );
            stmt.bind(1, pname);
            while (stmt.step())
            {
                packages.push_back(read_package(stmt));
            }
        }
        catch (const sqlite_error& e)
        {
            return query_error(e);
        }
        return { std::move(packages) };
    }

    auto QueryResolver::stats() const -> const QueryStats&
    {
        return m_stats;
    }

    auto QueryResolver::has_system_column() const -> bool
    {
        return m_has_system;
    }
}
