// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <sstream>
#include <thread>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <reproc++/drain.hpp>
#include <reproc++/reproc.hpp>

#include "nixdata/core/bulk_loader.hpp"
#include "nixdata/core/output.hpp"
#include "nixdata/util/csv.hpp"
#include "nixdata/util/string.hpp"

#include "sqlite.hpp"

namespace nixdata
{
    namespace
    {
        auto check_row_sizes(const TableRows& data) -> expected_t<void>
        {
            for (std::size_t i = 0; i < data.rows.size(); ++i)
            {
                if (data.rows[i].size() != data.columns.size())
                {
                    return make_unexpected(
                        fmt::format(
                            "Row {} of table {} has {} fields, expected {}",
                            i,
                            data.table,
                            data.rows[i].size(),
                            data.columns.size()
                        ),
                        nixdata_error_code::store_failed
                    );
                }
            }
            return {};
        }

        auto insert_statement(const TableRows& data) -> std::string
        {
            std::vector<std::string> columns;
            columns.reserve(data.columns.size());
            for (const auto& col : data.columns)
            {
                columns.push_back(quote_identifier(col));
            }
            const std::vector<std::string> placeholders(data.columns.size(), "?");
            return fmt::format(
                "INSERT INTO {} ({}) VALUES ({})",
                quote_identifier(data.table),
                fmt::join(columns, ", "),
                fmt::join(placeholders, ", ")
            );
        }
    }

    /**************
     * BulkLoader *
     **************/

    auto BulkLoader::load(const fs::path& store, const TableRows& data) -> expected_t<std::size_t>
    {
        if (auto valid = check_row_sizes(data); !valid)
        {
            return forward_error(valid);
        }
        auto loaded = load_impl(store, data);
        if (loaded)
        {
            LOG_INFO << "Loaded " << *loaded << " rows into " << data.table;
        }
        return loaded;
    }

    /***********************
     * InProcessBulkLoader *
     ***********************/

    auto InProcessBulkLoader::load_impl(const fs::path& store, const TableRows& data)
        -> expected_t<std::size_t>
    {
        try
        {
            SQLiteDatabase db(store, SQLiteDatabase::OpenMode::read_write);
            db.execute("BEGIN TRANSACTION");
            {
                auto stmt = db.prepare(insert_statement(data));
                for (const auto& row : data.rows)
                {
                    for (std::size_t i = 0; i < row.size(); ++i)
                    {
                        stmt.bind(static_cast<int>(i + 1), row[i]);
                    }
                    stmt.step();
                    stmt.reset(true);
                }
            }
            db.execute("COMMIT");
        }
        catch (const sqlite_error& e)
        {
            // The connection is closed before the transaction commits, which rolls it back
            return make_unexpected(
                fmt::format("Bulk load into {} failed: {}", data.table, e.what()),
                nixdata_error_code::store_failed
            );
        }
        return { data.rows.size() };
    }

    /************************
     * SubprocessBulkLoader *
     ************************/

    SubprocessBulkLoader::SubprocessBulkLoader(std::string executable)
        : m_executable(std::move(executable))
    {
    }

    const std::string& SubprocessBulkLoader::executable() const
    {
        return m_executable;
    }

    auto SubprocessBulkLoader::load_impl(const fs::path& store, const TableRows& data)
        -> expected_t<std::size_t>
    {
        if (data.rows.empty())
        {
            return { std::size_t(0) };
        }

        std::ostringstream csv;
        for (const auto& row : data.rows)
        {
            util::write_csv_row(csv, row);
        }
        const std::string input = std::move(csv).str();

        const std::vector<std::string> args = {
            m_executable,
            "-bail",
            "-batch",
            "-csv",
            store.string(),
            fmt::format(".import /dev/stdin {}", data.table),
        };
        LOG_DEBUG << "Running " << fmt::format("{}", fmt::join(args, " "));

        reproc::process process;
        if (const auto ec = process.start(args); ec)
        {
            return make_unexpected(
                fmt::format("Could not start {}: {}", m_executable, ec.message()),
                nixdata_error_code::subprocess_failed
            );
        }

        // Rows are written from another thread while the output streams are drained, a
        // child blocked on a full stderr pipe would otherwise never read its input.
        std::error_code write_ec;
        std::thread writer(
            [&process, &input, &write_ec]()
            {
                std::size_t written = 0;
                const auto* bytes = reinterpret_cast<const uint8_t*>(input.data());
                while (written < input.size())
                {
                    auto [n, ec] = process.write(bytes + written, input.size() - written);
                    if (ec)
                    {
                        // The child exited early, its status tells why
                        write_ec = ec;
                        break;
                    }
                    written += n;
                }
                if (const auto ec = process.close(reproc::stream::in); ec && !write_ec)
                {
                    write_ec = ec;
                }
            }
        );

        std::string out;
        std::string err;
        const auto drain_ec = reproc::drain(process, reproc::sink::string(out), reproc::sink::string(err));
        if (drain_ec)
        {
            // Unblocks the writer
            const auto kill_ec = process.kill();
            if (kill_ec)
            {
                LOG_WARNING << "Could not kill " << m_executable << ": " << kill_ec.message();
            }
        }
        writer.join();
        auto [status, wait_ec] = process.wait(reproc::infinite);

        if (wait_ec)
        {
            return make_unexpected(
                fmt::format("Could not wait for {}: {}", m_executable, wait_ec.message()),
                nixdata_error_code::subprocess_failed
            );
        }
        if (status != 0)
        {
            return make_unexpected(
                fmt::format(
                    "{} exited with status {} while importing {}: {}",
                    m_executable,
                    status,
                    data.table,
                    util::strip(err)
                ),
                nixdata_error_code::subprocess_failed
            );
        }
        if (write_ec || drain_ec)
        {
            return make_unexpected(
                fmt::format(
                    "Could not stream rows to {}: {}",
                    m_executable,
                    (write_ec ? write_ec : drain_ec).message()
                ),
                nixdata_error_code::subprocess_failed
            );
        }
        // sqlite3 reports malformed rows on stderr without failing
        if (!util::strip(err).empty())
        {
            return make_unexpected(
                fmt::format("{} rejected rows of {}: {}", m_executable, data.table, util::strip(err)),
                nixdata_error_code::subprocess_failed
            );
        }
        return { data.rows.size() };
    }

    auto make_bulk_loader(const BulkLoadParams& params) -> std::unique_ptr<BulkLoader>
    {
        switch (params.loader)
        {
            case BulkLoaderKind::sqlite3:
                return std::make_unique<SubprocessBulkLoader>(params.sqlite3_executable);
            case BulkLoaderKind::in_process:
                break;
        }
        return std::make_unique<InProcessBulkLoader>();
    }
}
