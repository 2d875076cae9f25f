// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_UTIL_HPP
#define NIXDATA_CORE_UTIL_HPP

#include <chrono>
#include <fstream>
#include <string>
#include <string_view>

#include "nixdata/core/error_handling.hpp"
#include "nixdata/fs/filesystem.hpp"

namespace nixdata
{
    // Read the whole content of a file, throws std::system_error if it cannot be opened.
    std::string read_contents(const fs::path& path);

    // Write ``content`` to a temporary file next to ``path`` and rename it into place.
    void write_contents_atomic(const fs::path& path, std::string_view content);

    std::ofstream open_ofstream(
        const fs::path& path,
        std::ios::openmode mode = std::ios::out | std::ios::binary
    );

    class TemporaryDirectory
    {
    public:

        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        const fs::path& path() const;
        operator fs::path();

    private:

        fs::path m_path;
    };

    class TemporaryFile
    {
    public:

        // Create an empty file in ``dir`` named after ``prefix`` and a random suffix.
        TemporaryFile(const fs::path& dir, const std::string& prefix = "nixdataf");
        ~TemporaryFile();

        TemporaryFile(const TemporaryFile&) = delete;
        TemporaryFile& operator=(const TemporaryFile&) = delete;

        const fs::path& path() const;

        // Rename the file to ``target``; the file is not removed on destruction afterwards.
        void commit(const fs::path& target);

    private:

        fs::path m_path;
        bool m_committed = false;
    };

    // Advisory exclusive lock on ``<path>``, held until destruction.
    //
    // The lock is taken with ``flock`` on a dedicated lock file, so two ``LockFile`` in the
    // same process on the same path exclude each other as well.
    class LockFile
    {
    public:

        // Try to lock ``path`` until ``timeout`` expires, polling at a short interval.
        // A zero timeout makes a single attempt.
        static auto acquire(const fs::path& path, std::chrono::seconds timeout)
            -> expected_t<LockFile>;

        ~LockFile();

        LockFile(const LockFile&) = delete;
        LockFile& operator=(const LockFile&) = delete;

        LockFile(LockFile&&) noexcept;
        LockFile& operator=(LockFile&&) noexcept;

        const fs::path& path() const;
        bool is_locked() const;

    private:

        LockFile(fs::path path, int fd);

        void release();

        fs::path m_path;
        int m_fd = -1;
    };
}

#endif
