#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace ingest {

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(256 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

bool GzipReader::Refill() {
    const ssize_t n = source_->Read(in_buffer_);
    if (n < 0) {
        failed_ = true;
        return false;
    }
    if (n == 0) {
        source_eof_ = true;
        return false;
    }
    strm_.avail_in = static_cast<uInt>(n);
    strm_.next_in = in_buffer_.data();
    return true;
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (failed_) return -1;
    if (finished_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (member_done_) {
            // Previous member ended; another one may follow.
            if (strm_.avail_in == 0 && !Refill()) {
                if (failed_) return -1;
                finished_ = true;
                break;
            }
            if (inflateReset(&strm_) != Z_OK) {
                failed_ = true;
                return -1;
            }
            member_done_ = false;
        }

        if (strm_.avail_in == 0 && !Refill()) {
            if (failed_) return -1;
            // Source exhausted in the middle of a member: truncated input.
            failed_ = true;
            return -1;
        }

        const int ret = inflate(&strm_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            member_done_ = true;
            continue;
        }
        // Z_BUF_ERROR is not fatal; it just means we need more input or output space.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            failed_ = true;
            return -1;
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace ingest
