// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_BULK_LOADER_HPP
#define NIXDATA_CORE_BULK_LOADER_HPP

#include <memory>
#include <string>
#include <vector>

#include "nixdata/core/context.hpp"
#include "nixdata/core/error_handling.hpp"
#include "nixdata/fs/filesystem.hpp"

namespace nixdata
{
    /**
     * Rows to append to an existing table, as text in the table column order.
     */
    struct TableRows
    {
        using row_type = std::vector<std::string>;

        std::string table;
        std::vector<std::string> columns;
        std::vector<row_type> rows;
    };

    /**
     * Load a batch of rows into a table of a store in one operation.
     */
    class BulkLoader
    {
    public:

        virtual ~BulkLoader() = default;

        BulkLoader(const BulkLoader&) = delete;
        BulkLoader& operator=(const BulkLoader&) = delete;
        BulkLoader(BulkLoader&&) = delete;
        BulkLoader& operator=(BulkLoader&&) = delete;

        /**
         * Append all rows to ``data.table`` in the store at ``store``.
         *
         * The store must be closed by the caller. Returns the number of rows loaded.
         */
        [[nodiscard]] auto load(const fs::path& store, const TableRows& data)
            -> expected_t<std::size_t>;

    protected:

        BulkLoader() = default;

    private:

        virtual auto load_impl(const fs::path& store, const TableRows& data)
            -> expected_t<std::size_t> = 0;
    };

    /**
     * Prepared INSERT statement run for every row inside a single transaction.
     */
    class InProcessBulkLoader : public BulkLoader
    {
    private:

        auto load_impl(const fs::path& store, const TableRows& data)
            -> expected_t<std::size_t> override;
    };

    /**
     * Stream the rows as CSV to ``sqlite3 -csv <store> ".import /dev/stdin <table>"``.
     */
    class SubprocessBulkLoader : public BulkLoader
    {
    public:

        explicit SubprocessBulkLoader(std::string executable = "sqlite3");

        const std::string& executable() const;

    private:

        auto load_impl(const fs::path& store, const TableRows& data)
            -> expected_t<std::size_t> override;

        std::string m_executable;
    };

    [[nodiscard]] auto make_bulk_loader(const BulkLoadParams& params) -> std::unique_ptr<BulkLoader>;
}

#endif
