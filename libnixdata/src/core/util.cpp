// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <fmt/format.h>
#include <sys/file.h>
#include <unistd.h>

#include "nixdata/core/output.hpp"
#include "nixdata/core/util.hpp"

namespace nixdata
{
    namespace
    {
        constexpr auto lock_poll_interval = std::chrono::milliseconds(100);

        std::string generate_random_alphanumeric_string(std::size_t len)
        {
            static constexpr std::string_view chars = "0123456789"
                                                      "abcdefghijklmnopqrstuvwxyz"
                                                      "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
            thread_local auto engine = std::mt19937(std::random_device{}());
            auto dist = std::uniform_int_distribution<std::size_t>(0, chars.size() - 1);
            std::string out(len, '\0');
            for (auto& c : out)
            {
                c = chars[dist(engine)];
            }
            return out;
        }
    }

    std::string read_contents(const fs::path& path)
    {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in)
        {
            throw std::system_error(
                errno,
                std::generic_category(),
                fmt::format("failed to open '{}' for reading", path.string())
            );
        }
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

    std::ofstream open_ofstream(const fs::path& path, std::ios::openmode mode)
    {
        std::ofstream outfile(path, mode);
        if (!outfile.good())
        {
            LOG_ERROR << "Error opening for writing " << path << ": " << std::strerror(errno);
            throw std::system_error(
                errno,
                std::generic_category(),
                fmt::format("failed to open '{}' for writing", path.string())
            );
        }
        return outfile;
    }

    void write_contents_atomic(const fs::path& path, std::string_view content)
    {
        auto tmp = TemporaryFile(path.parent_path(), path.filename().string() + ".");
        {
            auto out = open_ofstream(tmp.path());
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.close();
            if (out.fail())
            {
                throw std::system_error(
                    errno,
                    std::generic_category(),
                    fmt::format("failed to write '{}'", tmp.path().string())
                );
            }
        }
        tmp.commit(path);
    }

    /**********************
     * TemporaryDirectory *
     **********************/

    TemporaryDirectory::TemporaryDirectory()
    {
        std::string template_path = (fs::temp_directory_path() / "nixdata_XXXXXX").string();
        char* pth = ::mkdtemp(template_path.data());
        if (pth == nullptr)
        {
            throw std::system_error(
                errno,
                std::generic_category(),
                "Could not create temporary directory"
            );
        }
        m_path = pth;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
        if (ec)
        {
            LOG_WARNING << "Could not remove temporary directory " << m_path << ": "
                        << ec.message();
        }
    }

    const fs::path& TemporaryDirectory::path() const
    {
        return m_path;
    }

    TemporaryDirectory::operator fs::path()
    {
        return m_path;
    }

    /*****************
     * TemporaryFile *
     *****************/

    TemporaryFile::TemporaryFile(const fs::path& dir, const std::string& prefix)
    {
        for (int attempt = 0; attempt < 16; ++attempt)
        {
            auto candidate = dir / (prefix + generate_random_alphanumeric_string(10));
            const int fd = ::open(candidate.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
            if (fd >= 0)
            {
                ::close(fd);
                m_path = std::move(candidate);
                return;
            }
            if (errno != EEXIST)
            {
                break;
            }
        }
        throw std::system_error(
            errno,
            std::generic_category(),
            fmt::format("Could not create temporary file in '{}'", dir.string())
        );
    }

    TemporaryFile::~TemporaryFile()
    {
        if (!m_committed)
        {
            std::error_code ec;
            fs::remove(m_path, ec);
        }
    }

    const fs::path& TemporaryFile::path() const
    {
        return m_path;
    }

    void TemporaryFile::commit(const fs::path& target)
    {
        fs::rename(m_path, target);
        m_committed = true;
    }

    /************
     * LockFile *
     ************/

    auto LockFile::acquire(const fs::path& path, std::chrono::seconds timeout) -> expected_t<LockFile>
    {
        const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
        if (fd < 0)
        {
            return make_unexpected(
                fmt::format("Could not open lock file '{}': {}", path.string(), std::strerror(errno)),
                nixdata_error_code::cache_locked
            );
        }

        // Owns the descriptor from here on
        auto lock = LockFile(path, fd);
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool warned = false;
        while (::flock(fd, LOCK_EX | LOCK_NB) != 0)
        {
            if (errno != EWOULDBLOCK && errno != EINTR)
            {
                return make_unexpected(
                    fmt::format("Could not lock '{}': {}", path.string(), std::strerror(errno)),
                    nixdata_error_code::cache_locked
                );
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return make_unexpected(
                    fmt::format(
                        "Timed out after {}s waiting for lock '{}'",
                        timeout.count(),
                        path.string()
                    ),
                    nixdata_error_code::cache_locked
                );
            }
            if (!warned)
            {
                LOG_WARNING << "Cannot lock '" << path.string() << "'"
                            << "\nWaiting for other nix-data process to finish";
                warned = true;
            }
            std::this_thread::sleep_for(lock_poll_interval);
        }
        LOG_TRACE << "Lock acquired on '" << path.string() << "'";
        return { std::move(lock) };
    }

    LockFile::LockFile(fs::path path, int fd)
        : m_path(std::move(path))
        , m_fd(fd)
    {
    }

    LockFile::~LockFile()
    {
        release();
    }

    LockFile::LockFile(LockFile&& rhs) noexcept
        : m_path(std::move(rhs.m_path))
        , m_fd(rhs.m_fd)
    {
        rhs.m_fd = -1;
    }

    LockFile& LockFile::operator=(LockFile&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            m_path = std::move(rhs.m_path);
            m_fd = rhs.m_fd;
            rhs.m_fd = -1;
        }
        return *this;
    }

    const fs::path& LockFile::path() const
    {
        return m_path;
    }

    bool LockFile::is_locked() const
    {
        return m_fd >= 0;
    }

    void LockFile::release()
    {
        if (m_fd >= 0)
        {
            // Closing the descriptor drops the flock
            ::close(m_fd);
            m_fd = -1;
        }
    }
}
