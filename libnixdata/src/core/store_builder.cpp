// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <system_error>

#include <fmt/format.h>

#include "nixdata/core/output.hpp"
#include "nixdata/core/store_builder.hpp"

#include "sqlite.hpp"

namespace nixdata
{
    namespace
    {
        constexpr const char* extended_pkgs_schema = R"sql(
            CREATE TABLE "pkgs" (
                "attribute" TEXT NOT NULL UNIQUE,
                "system" TEXT,
                "pname" TEXT,
                "version" TEXT,
                PRIMARY KEY("attribute")
            );
        )sql";

        constexpr const char* plain_pkgs_schema = R"sql(
            CREATE TABLE "pkgs" (
                "attribute" TEXT NOT NULL UNIQUE,
                "pname" TEXT,
                "version" TEXT,
                PRIMARY KEY("attribute")
            );
        )sql";

        constexpr const char* meta_schema = R"sql(
            CREATE TABLE "meta" (
                "attribute" TEXT NOT NULL UNIQUE,
                "broken" INTEGER,
                "insecure" INTEGER,
                "unsupported" INTEGER,
                "unfree" INTEGER,
                "description" TEXT,
                "longdescription" TEXT,
                "homepage" TEXT,
                "maintainers" TEXT,
                "position" TEXT,
                "license" TEXT,
                "platforms" TEXT,
                FOREIGN KEY("attribute") REFERENCES "pkgs"("attribute"),
                PRIMARY KEY("attribute")
            );
            CREATE UNIQUE INDEX "metaattributes" ON "meta" ("attribute");
        )sql";

        constexpr const char* pkgs_indexes = R"sql(
            CREATE UNIQUE INDEX "attributes" ON "pkgs" ("attribute");
            CREATE INDEX "pnames" ON "pkgs" ("pname");
        )sql";

        auto flag(bool value) -> std::string
        {
            return value ? "1" : "0";
        }

        void remove_artifact(const fs::path& artifact)
        {
            std::error_code ec;
            fs::remove(artifact, ec);
            if (ec)
            {
                LOG_WARNING << "Could not remove partial store " << artifact << ": "
                            << ec.message();
            }
        }
    }

    auto serialize_json_column(const std::optional<nlohmann::json>& value) -> std::string
    {
        if (!value)
        {
            return {};
        }
        // Invalid UTF-8 in a string value becomes U+FFFD
        return value->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    auto make_pkgs_rows(const IndexDocument& doc) -> TableRows
    {
        const bool extended = doc.variant == IndexVariant::extended;
        TableRows out;
        out.table = "pkgs";
        out.columns = extended
                          ? std::vector<std::string>{ "attribute", "system", "pname", "version" }
                          : std::vector<std::string>{ "attribute", "pname", "version" };
        out.rows.reserve(doc.packages.size());
        for (const auto& [attr, record] : doc.packages)
        {
            if (extended)
            {
                out.rows.push_back({ attr, record.system.value_or(""), record.pname, record.version });
            }
            else
            {
                out.rows.push_back({ attr, record.pname, record.version });
            }
        }
        return out;
    }

    auto make_meta_rows(const IndexDocument& doc) -> TableRows
    {
        TableRows out;
        out.table = "meta";
        out.columns = {
            "attribute",   "broken",      "insecure", "unsupported", "unfree",  "description",
            "longdescription", "homepage", "maintainers", "position", "license", "platforms",
        };
        out.rows.reserve(doc.packages.size());
        for (const auto& [attr, record] : doc.packages)
        {
            const auto& meta = record.meta;
            out.rows.push_back({
                attr,
                flag(meta.broken),
                flag(meta.insecure),
                flag(meta.unsupported),
                flag(meta.unfree),
                meta.description.value_or(""),
                meta.longdescription.value_or(""),
                meta.homepage ? meta.homepage->resolve() : std::string(),
                serialize_json_column(meta.maintainers),
                meta.position.value_or(""),
                serialize_json_column(meta.license),
                serialize_json_column(meta.platforms),
            });
        }
        return out;
    }

    auto create_store_schema(const fs::path& artifact, IndexVariant variant) -> expected_t<void>
    {
        if (variant == IndexVariant::raw)
        {
            return make_unexpected(
                "A raw document has no relational schema",
                nixdata_error_code::store_failed
            );
        }
        try
        {
            SQLiteDatabase db(artifact, SQLiteDatabase::OpenMode::create);
            if (variant == IndexVariant::extended)
            {
                db.execute(extended_pkgs_schema);
                db.execute(meta_schema);
            }
            else
            {
                db.execute(plain_pkgs_schema);
            }
            db.execute(pkgs_indexes);
        }
        catch (const sqlite_error& e)
        {
            return make_unexpected(
                fmt::format("Could not create store schema: {}", e.what()),
                nixdata_error_code::store_failed
            );
        }
        return {};
    }

    /****************
     * StoreBuilder *
     ****************/

    StoreBuilder::StoreBuilder(BulkLoader& loader)
        : m_loader(loader)
    {
    }

    auto StoreBuilder::build(const IndexDocument& doc, const fs::path& artifact)
        -> expected_t<StoreStats>
    {
        std::error_code ec;
        if (fs::exists(artifact, ec))
        {
            LOG_DEBUG << "Removing previous store " << artifact;
            fs::remove(artifact, ec);
        }
        if (ec)
        {
            return make_unexpected(
                fmt::format("Could not remove previous store {}: {}", artifact.string(), ec.message()),
                nixdata_error_code::store_failed
            );
        }

        LOG_INFO << "Building store " << artifact << " from " << doc.packages.size() << " packages";
        if (auto schema = create_store_schema(artifact, doc.variant); !schema)
        {
            remove_artifact(artifact);
            return forward_error(schema);
        }

        StoreStats stats;
        auto pkgs = m_loader.load(artifact, make_pkgs_rows(doc));
        if (!pkgs)
        {
            remove_artifact(artifact);
            return forward_error(pkgs);
        }
        stats.pkgs_rows = *pkgs;

        if (doc.variant == IndexVariant::extended)
        {
            auto meta = m_loader.load(artifact, make_meta_rows(doc));
            if (!meta)
            {
                remove_artifact(artifact);
                return forward_error(meta);
            }
            stats.meta_rows = *meta;
        }
        return { stats };
    }
}
