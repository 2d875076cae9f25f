// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <utility>

#include <fmt/format.h>

#include "sqlite.hpp"

namespace nixdata
{
    /****************
     * sqlite_error *
     ****************/

    sqlite_error::sqlite_error(const std::string& what, int code)
        : std::runtime_error(what)
        , m_code(code)
    {
    }

    int sqlite_error::code() const noexcept
    {
        return m_code;
    }

    /******************
     * SQLiteDatabase *
     ******************/

    SQLiteDatabase::SQLiteDatabase(const fs::path& path, OpenMode mode)
        : m_path(path)
    {
        int flags = SQLITE_OPEN_READONLY;
        if (mode == OpenMode::read_write)
        {
            flags = SQLITE_OPEN_READWRITE;
        }
        else if (mode == OpenMode::create)
        {
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        }

        const int rc = sqlite3_open_v2(path.c_str(), &p_handle, flags, nullptr);
        if (rc != SQLITE_OK)
        {
            const std::string msg = p_handle ? sqlite3_errmsg(p_handle) : sqlite3_errstr(rc);
            sqlite3_close(p_handle);
            p_handle = nullptr;
            throw sqlite_error(fmt::format("Could not open '{}': {}", path.string(), msg), rc);
        }
        sqlite3_extended_result_codes(p_handle, 1);
    }

    SQLiteDatabase::~SQLiteDatabase()
    {
        // Statements are always finalized before their connection goes away
        sqlite3_close(p_handle);
    }

    SQLiteDatabase::SQLiteDatabase(SQLiteDatabase&& rhs) noexcept
        : p_handle(std::exchange(rhs.p_handle, nullptr))
        , m_path(std::move(rhs.m_path))
    {
    }

    SQLiteDatabase& SQLiteDatabase::operator=(SQLiteDatabase&& rhs) noexcept
    {
        using std::swap;
        swap(p_handle, rhs.p_handle);
        swap(m_path, rhs.m_path);
        return *this;
    }

    void SQLiteDatabase::execute(const std::string& sql)
    {
        char* errmsg = nullptr;
        const int rc = sqlite3_exec(p_handle, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            const std::string msg = errmsg ? errmsg : sqlite3_errstr(rc);
            sqlite3_free(errmsg);
            throw sqlite_error(fmt::format("SQL error on '{}': {}", m_path.string(), msg), rc);
        }
    }

    SQLiteStatement SQLiteDatabase::prepare(const std::string& sql)
    {
        sqlite3_stmt* stmt = nullptr;
        const int rc = sqlite3_prepare_v2(p_handle, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throw_error(fmt::format("Could not prepare \"{}\"", sql), rc);
        }
        return SQLiteStatement(stmt, p_handle);
    }

    const fs::path& SQLiteDatabase::path() const
    {
        return m_path;
    }

    void SQLiteDatabase::throw_error(const std::string& context, int code) const
    {
        throw sqlite_error(
            fmt::format("{} on '{}': {}", context, m_path.string(), sqlite3_errmsg(p_handle)),
            code
        );
    }

    /*******************
     * SQLiteStatement *
     *******************/

    SQLiteStatement::SQLiteStatement(sqlite3_stmt* stmt, sqlite3* db)
        : p_stmt(stmt)
        , p_db(db)
    {
    }

    SQLiteStatement::~SQLiteStatement()
    {
        sqlite3_finalize(p_stmt);
    }

    SQLiteStatement::SQLiteStatement(SQLiteStatement&& rhs) noexcept
        : p_stmt(std::exchange(rhs.p_stmt, nullptr))
        , p_db(std::exchange(rhs.p_db, nullptr))
    {
    }

    SQLiteStatement& SQLiteStatement::operator=(SQLiteStatement&& rhs) noexcept
    {
        using std::swap;
        swap(p_stmt, rhs.p_stmt);
        swap(p_db, rhs.p_db);
        return *this;
    }

    SQLiteStatement& SQLiteStatement::bind(int index, std::string_view value)
    {
        const int rc = sqlite3_bind_text(
            p_stmt,
            index,
            value.data(),
            static_cast<int>(value.size()),
            SQLITE_TRANSIENT
        );
        if (rc != SQLITE_OK)
        {
            throw sqlite_error(
                fmt::format("Could not bind parameter {}: {}", index, sqlite3_errmsg(p_db)),
                rc
            );
        }
        return *this;
    }

    bool SQLiteStatement::step()
    {
        const int rc = sqlite3_step(p_stmt);
        if (rc == SQLITE_ROW)
        {
            return true;
        }
        if (rc == SQLITE_DONE)
        {
            return false;
        }
        throw sqlite_error(
            fmt::format("Could not run \"{}\": {}", sqlite3_sql(p_stmt), sqlite3_errmsg(p_db)),
            rc
        );
    }

    void SQLiteStatement::reset(bool clear_bindings)
    {
        sqlite3_reset(p_stmt);
        if (clear_bindings)
        {
            sqlite3_clear_bindings(p_stmt);
        }
    }

    std::string SQLiteStatement::column_text(int column) const
    {
        const auto* text = sqlite3_column_text(p_stmt, column);
        if (text == nullptr)
        {
            return {};
        }
        return std::string(
            reinterpret_cast<const char*>(text),
            static_cast<std::size_t>(sqlite3_column_bytes(p_stmt, column))
        );
    }

    std::int64_t SQLiteStatement::column_int(int column) const
    {
        return sqlite3_column_int64(p_stmt, column);
    }

    bool SQLiteStatement::column_is_null(int column) const
    {
        return sqlite3_column_type(p_stmt, column) == SQLITE_NULL;
    }

    std::string quote_identifier(std::string_view name)
    {
        std::string out = "\"";
        for (const char c : name)
        {
            if (c == '"')
            {
                out += '"';
            }
            out += c;
        }
        out += '"';
        return out;
    }
}
