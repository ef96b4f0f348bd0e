#pragma once

#include "io/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace ingest {

// Streaming gunzip over another reader. Concatenated gzip members (as written
// by bgzip and parallel gzip tools) are decoded back to back. A stream that
// ends before the final member's trailer reads as an error.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

  private:
    bool Refill();

    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool member_done_ = false;
    bool source_eof_ = false;
    bool finished_ = false;
    bool failed_ = false;
};

} // namespace ingest
