#pragma once

#include "io/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace tzupdater {

// Streaming gzip decoder over another reader. Throws std::runtime_error when
// zlib cannot be initialized.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

    std::uint64_t CompressedBytesRead() const { return compressed_read_; }

  private:
    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    std::uint64_t compressed_read_ = 0;
    bool eof_reached_ = false;
};

} // namespace tzupdater
