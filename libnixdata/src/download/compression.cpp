// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>

#include <brotli/decode.h>
#include <bzlib.h>
#include <zstd.h>

#include "nixdata/core/output.hpp"
#include "nixdata/util/string.hpp"

#include "compression.hpp"

namespace nixdata::download
{
    /*********************
     * CompressionStream *
     *********************/

    CompressionStream::CompressionStream(writer&& func)
        : m_writer(std::move(func))
    {
    }

    size_t CompressionStream::write(char* in, size_t size)
    {
        return write_impl(in, size);
    }

    bool CompressionStream::is_complete() const
    {
        return is_complete_impl();
    }

    size_t CompressionStream::invoke_writer(char* in, size_t size)
    {
        return m_writer(in, size);
    }

    /***************************
     * BrotliCompressionStream *
     ***************************/

    class BrotliCompressionStream : public CompressionStream
    {
    public:

        using base_type = CompressionStream;
        using writer = base_type::writer;

        explicit BrotliCompressionStream(writer&& func);
        virtual ~BrotliCompressionStream();

    private:

        size_t write_impl(char* in, size_t size) override;
        bool is_complete_impl() const override;

        static constexpr size_t BUFFER_SIZE = 256 * 1024;

        BrotliDecoderState* p_state;
        bool m_finished = false;
        char m_buffer[BUFFER_SIZE];
    };

    BrotliCompressionStream::BrotliCompressionStream(writer&& func)
        : base_type(std::move(func))
        , p_state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr))
    {
        if (p_state == nullptr)
        {
            throw std::runtime_error("BrotliDecoderCreateInstance failed");
        }
    }

    BrotliCompressionStream::~BrotliCompressionStream()
    {
        BrotliDecoderDestroyInstance(p_state);
    }

    size_t BrotliCompressionStream::write_impl(char* in, size_t size)
    {
        size_t available_in = size;
        const auto* next_in = reinterpret_cast<const uint8_t*>(in);

        while (true)
        {
            size_t available_out = BUFFER_SIZE;
            auto* next_out = reinterpret_cast<uint8_t*>(m_buffer);
            const auto ret = BrotliDecoderDecompressStream(
                p_state,
                &available_in,
                &next_in,
                &available_out,
                &next_out,
                nullptr
            );
            if (ret == BROTLI_DECODER_RESULT_ERROR)
            {
                LOG_ERROR << "Brotli decompression error: "
                          << BrotliDecoderErrorString(BrotliDecoderGetErrorCode(p_state));
                return size + 1;
            }

            const size_t produced = BUFFER_SIZE - available_out;
            if (produced > 0 && base_type::invoke_writer(m_buffer, produced) != produced)
            {
                return size + 1;
            }

            if (ret == BROTLI_DECODER_RESULT_SUCCESS)
            {
                m_finished = true;
                break;
            }
            if (ret == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT)
            {
                break;
            }
            // BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT, drain again
        }
        return size;
    }

    bool BrotliCompressionStream::is_complete_impl() const
    {
        return m_finished;
    }

    /*************************
     * ZstdCompressionStream *
     *************************/

    class ZstdCompressionStream : public CompressionStream
    {
    public:

        using base_type = CompressionStream;
        using writer = base_type::writer;

        explicit ZstdCompressionStream(writer&& func);
        virtual ~ZstdCompressionStream();

    private:

        size_t write_impl(char* in, size_t size) override;
        bool is_complete_impl() const override;

        static constexpr size_t BUFFER_SIZE = 256 * 1024;

        ZSTD_DCtx* p_stream;
        bool m_frame_done = false;
        char m_buffer[BUFFER_SIZE];
    };

    ZstdCompressionStream::ZstdCompressionStream(writer&& func)
        : base_type(std::move(func))
        , p_stream(ZSTD_createDCtx())
    {
        ZSTD_initDStream(p_stream);
    }

    ZstdCompressionStream::~ZstdCompressionStream()
    {
        ZSTD_freeDCtx(p_stream);
    }

    size_t ZstdCompressionStream::write_impl(char* in, size_t size)
    {
        ZSTD_inBuffer input = { in, size, 0 };
        ZSTD_outBuffer output = { m_buffer, BUFFER_SIZE, 0 };

        while (input.pos < input.size)
        {
            auto ret = ZSTD_decompressStream(p_stream, &output, &input);
            if (ZSTD_isError(ret))
            {
                LOG_ERROR << "ZSTD decompression error: " << ZSTD_getErrorName(ret);
                return size + 1;
            }
            m_frame_done = (ret == 0);
            if (output.pos > 0)
            {
                size_t wcb_res = base_type::invoke_writer(m_buffer, output.pos);
                if (wcb_res != output.pos)
                {
                    return size + 1;
                }
                output.pos = 0;
            }
        }
        return size;
    }

    bool ZstdCompressionStream::is_complete_impl() const
    {
        return m_frame_done;
    }

    /**************************
     * Bzip2CompressionStream *
     **************************/

    class Bzip2CompressionStream : public CompressionStream
    {
    public:

        using base_type = CompressionStream;
        using writer = base_type::writer;

        explicit Bzip2CompressionStream(writer&& func);
        virtual ~Bzip2CompressionStream();

    private:

        size_t write_impl(char* in, size_t size) override;
        bool is_complete_impl() const override;

        static constexpr size_t BUFFER_SIZE = 256 * 1024;

        bz_stream m_stream;
        bool m_stream_end = false;
        char m_buffer[BUFFER_SIZE];
    };

    Bzip2CompressionStream::Bzip2CompressionStream(writer&& func)
        : base_type(std::move(func))
    {
        m_stream.bzalloc = nullptr;
        m_stream.bzfree = nullptr;
        m_stream.opaque = nullptr;

        int error = BZ2_bzDecompressInit(&m_stream, 0, false);
        if (error != BZ_OK)
        {
            throw std::runtime_error("BZ2_bzDecompressInit failed");
        }
    }

    Bzip2CompressionStream::~Bzip2CompressionStream()
    {
        BZ2_bzDecompressEnd(&m_stream);
    }

    size_t Bzip2CompressionStream::write_impl(char* in, size_t size)
    {
        m_stream.next_in = in;
        m_stream.avail_in = static_cast<unsigned int>(size);

        while (m_stream.avail_in > 0 && !m_stream_end)
        {
            m_stream.next_out = m_buffer;
            m_stream.avail_out = Bzip2CompressionStream::BUFFER_SIZE;

            int ret = BZ2_bzDecompress(&m_stream);
            if (ret != BZ_OK && ret != BZ_STREAM_END)
            {
                LOG_ERROR << "Bzip2 decompression error: " << ret;
                return size + 1;
            }
            m_stream_end = (ret == BZ_STREAM_END);

            size_t wcb_res = base_type::invoke_writer(m_buffer, BUFFER_SIZE - m_stream.avail_out);
            if (wcb_res != BUFFER_SIZE - m_stream.avail_out)
            {
                return size + 1;
            }
        }
        return size;
    }

    bool Bzip2CompressionStream::is_complete_impl() const
    {
        return m_stream_end;
    }

    /***********************
     * NoCompressionStream *
     ***********************/

    class NoCompressionStream : public CompressionStream
    {
    public:

        using base_type = CompressionStream;
        using writer = base_type::writer;

        explicit NoCompressionStream(writer&& func);
        virtual ~NoCompressionStream() = default;

    private:

        size_t write_impl(char* in, size_t size) override;
        bool is_complete_impl() const override;
    };

    NoCompressionStream::NoCompressionStream(writer&& func)
        : base_type(std::move(func))
    {
    }

    size_t NoCompressionStream::write_impl(char* in, size_t size)
    {
        return base_type::invoke_writer(in, size);
    }

    bool NoCompressionStream::is_complete_impl() const
    {
        return true;
    }

    std::unique_ptr<CompressionStream> make_compression_stream(
        const std::string& url,
        const std::string& content_encoding,
        CompressionStream::writer&& func
    )
    {
        const auto encoding = util::to_lower(util::strip(content_encoding));
        if (!encoding.empty() && encoding != "identity")
        {
            if (encoding == "br")
            {
                return std::make_unique<BrotliCompressionStream>(std::move(func));
            }
            else if (encoding == "zstd")
            {
                return std::make_unique<ZstdCompressionStream>(std::move(func));
            }
            else if (encoding == "bzip2")
            {
                return std::make_unique<Bzip2CompressionStream>(std::move(func));
            }
            return nullptr;
        }

        // Query strings never carry the compression suffix
        const auto path = std::string_view(url).substr(0, url.find('?'));
        if (util::ends_with(path, ".br"))
        {
            return std::make_unique<BrotliCompressionStream>(std::move(func));
        }
        else if (util::ends_with(path, ".zst"))
        {
            return std::make_unique<ZstdCompressionStream>(std::move(func));
        }
        else if (util::ends_with(path, ".bz2"))
        {
            return std::make_unique<Bzip2CompressionStream>(std::move(func));
        }
        else
        {
            return std::make_unique<NoCompressionStream>(std::move(func));
        }
    }
}
