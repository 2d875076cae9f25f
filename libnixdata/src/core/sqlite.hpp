// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_SQLITE_HPP
#define NIXDATA_CORE_SQLITE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

extern "C"
{
#include <sqlite3.h>
}

#include "nixdata/fs/filesystem.hpp"

namespace nixdata
{
    class sqlite_error : public std::runtime_error
    {
    public:

        sqlite_error(const std::string& what, int code);

        int code() const noexcept;

    private:

        int m_code;
    };

    class SQLiteStatement;

    /**
     * RAII ``sqlite3*`` connection.
     */
    class SQLiteDatabase
    {
    public:

        enum class OpenMode
        {
            read_only,
            read_write,
            // Read-write, creating the file if missing
            create
        };

        SQLiteDatabase(const fs::path& path, OpenMode mode);
        ~SQLiteDatabase();

        SQLiteDatabase(const SQLiteDatabase&) = delete;
        SQLiteDatabase& operator=(const SQLiteDatabase&) = delete;

        SQLiteDatabase(SQLiteDatabase&& rhs) noexcept;
        SQLiteDatabase& operator=(SQLiteDatabase&& rhs) noexcept;

        // Run one or more statements without result rows.
        void execute(const std::string& sql);

        [[nodiscard]] SQLiteStatement prepare(const std::string& sql);

        const fs::path& path() const;

    private:

        [[noreturn]] void throw_error(const std::string& context, int code) const;

        sqlite3* p_handle = nullptr;
        fs::path m_path;

        friend class SQLiteStatement;
    };

    /**
     * RAII ``sqlite3_stmt*``, parameters are 1-based and columns 0-based as in SQLite.
     */
    class SQLiteStatement
    {
    public:

        ~SQLiteStatement();

        SQLiteStatement(const SQLiteStatement&) = delete;
        SQLiteStatement& operator=(const SQLiteStatement&) = delete;

        SQLiteStatement(SQLiteStatement&& rhs) noexcept;
        SQLiteStatement& operator=(SQLiteStatement&& rhs) noexcept;

        SQLiteStatement& bind(int index, std::string_view value);

        // Return true while a result row is available.
        bool step();

        // Ready the statement to be stepped again, keeping parameters unless cleared.
        void reset(bool clear_bindings = false);

        [[nodiscard]] std::string column_text(int column) const;
        [[nodiscard]] std::int64_t column_int(int column) const;
        [[nodiscard]] bool column_is_null(int column) const;

    private:

        SQLiteStatement(sqlite3_stmt* stmt, sqlite3* db);

        sqlite3_stmt* p_stmt = nullptr;
        sqlite3* p_db = nullptr;

        friend class SQLiteDatabase;
    };

    // Quote an identifier (table or column name) for SQL text.
    [[nodiscard]] std::string quote_identifier(std::string_view name);
}

#endif
