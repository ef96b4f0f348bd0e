#pragma once

#include "crypto/digest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ingest {

bool HexDigestEquals(std::string_view a, std::string_view b);

// Rolling MD5 over a byte stream, checked against an expected hex digest.
class ChecksumVerifier {
public:
    explicit ChecksumVerifier(std::string expected_md5);

    void Update(std::span<const std::uint8_t> chunk);
    std::uint64_t BytesSeen() const { return bytes_; }

    // Finalizes the digest. Integrity failure on mismatch or empty expectation.
    Result Finish();
    const std::string& ActualHex() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
    Hasher hasher_;
    std::uint64_t bytes_ = 0;
};

} // namespace ingest
