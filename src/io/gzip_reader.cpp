#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace tzupdater {

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(16384) {
    if (!source_) {
        throw std::runtime_error("GzipReader: null source");
    }
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS: expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0) {
            const ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return -1;
            if (n == 0) {
                // Truncated stream if inflate has not reported Z_STREAM_END.
                break;
            }
            compressed_read_ += static_cast<std::uint64_t>(n);
            strm_.avail_in = static_cast<uInt>(n);
            strm_.next_in = in_buffer_.data();
        }

        const int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            eof_reached_ = true;
            break;
        }

        // Z_BUF_ERROR only means more input or output space is needed.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return -1;
        }

        if (ret == Z_BUF_ERROR && strm_.avail_in == 0) {
            break;
        }
    }

    const size_t produced = out.size() - strm_.avail_out;
    if (produced == 0 && !eof_reached_) {
        // Source exhausted before the gzip trailer.
        return -1;
    }

    return static_cast<ssize_t>(produced);
}

} // namespace tzupdater
