// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_DL_COMPRESSION_HPP
#define NIXDATA_DL_COMPRESSION_HPP

#include <functional>
#include <memory>
#include <string>

namespace nixdata::download
{
    /**
     * Streaming decoder sitting between curl's write callback and the final sink.
     *
     * ``write`` returns the number of input bytes consumed. Any other value than ``size``
     * signals an error, and makes curl abort the transfer.
     */
    class CompressionStream
    {
    public:

        using writer = std::function<size_t(char*, size_t)>;

        virtual ~CompressionStream() = default;

        CompressionStream(const CompressionStream&) = delete;
        CompressionStream& operator=(const CompressionStream&) = delete;
        CompressionStream(CompressionStream&&) = delete;
        CompressionStream& operator=(CompressionStream&&) = delete;

        size_t write(char* in, size_t size);

        // True once the decoder has seen the end of a complete compressed stream.
        // Always true for the identity stream.
        bool is_complete() const;

    protected:

        CompressionStream(writer&& func);

        size_t invoke_writer(char* in, size_t size);

    private:

        virtual size_t write_impl(char* in, size_t size) = 0;
        virtual bool is_complete_impl() const = 0;

        writer m_writer;
    };

    /**
     * Select the decoder of a response body.
     *
     * A ``Content-Encoding`` other than ``identity`` takes precedence over the URL suffix
     * (``.br``, ``.zst``, ``.bz2``). Returns ``nullptr`` for an unsupported encoding.
     */
    std::unique_ptr<CompressionStream> make_compression_stream(
        const std::string& url,
        const std::string& content_encoding,
        CompressionStream::writer&& func
    );

}  // namespace nixdata::download

#endif  // NIXDATA_DL_COMPRESSION_HPP
