// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_STORE_BUILDER_HPP
#define NIXDATA_CORE_STORE_BUILDER_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "nixdata/core/bulk_loader.hpp"
#include "nixdata/core/error_handling.hpp"
#include "nixdata/core/index_document.hpp"
#include "nixdata/fs/filesystem.hpp"

namespace nixdata
{
    struct StoreStats
    {
        std::size_t pkgs_rows = 0;
        std::size_t meta_rows = 0;
    };

    /**
     * Rebuild a SQLite store from a decoded index.
     *
     * The store always has a ``pkgs`` table; extended indexes add a ``meta`` table.
     */
    class StoreBuilder
    {
    public:

        explicit StoreBuilder(BulkLoader& loader);

        /**
         * Delete ``artifact``, create the schema, then bulk load ``pkgs`` and ``meta``.
         *
         * On failure the partially built artifact is removed and the error returned.
         */
        [[nodiscard]] auto build(const IndexDocument& doc, const fs::path& artifact)
            -> expected_t<StoreStats>;

    private:

        BulkLoader& m_loader;
    };

    /**
     * Create the tables and indexes of ``variant`` in a new store at ``artifact``.
     */
    [[nodiscard]] auto create_store_schema(const fs::path& artifact, IndexVariant variant)
        -> expected_t<void>;

    /**
     * ``pkgs`` rows: attribute, [system,] pname, version.
     */
    [[nodiscard]] auto make_pkgs_rows(const IndexDocument& doc) -> TableRows;

    /**
     * ``meta`` rows of an extended index, flags as ``0``/``1`` and absent text as empty.
     */
    [[nodiscard]] auto make_meta_rows(const IndexDocument& doc) -> TableRows;

    /**
     * Compact JSON text of a structured field, empty when absent or not serializable.
     */
    [[nodiscard]] auto serialize_json_column(const std::optional<nlohmann::json>& value)
        -> std::string;
}

#endif
