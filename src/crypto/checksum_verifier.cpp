#include "crypto/checksum_verifier.hpp"

#include <cctype>

namespace ingest {

bool HexDigestEquals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

ChecksumVerifier::ChecksumVerifier(std::string expected_md5)
    : expected_(std::move(expected_md5)), hasher_(DigestAlgorithm::Md5) {}

void ChecksumVerifier::Update(std::span<const std::uint8_t> chunk) {
    hasher_.Update(chunk);
    bytes_ += chunk.size();
}

Result ChecksumVerifier::Finish() {
    if (expected_.empty())
        return Result::Fail(ErrorKind::Integrity, -1, "expected md5 is empty");

    actual_ = hasher_.FinalHex();
    if (actual_.empty())
        return Result::Fail(ErrorKind::Io, -1, "md5 compute failed");

    if (!HexDigestEquals(actual_, expected_)) {
        return Result::Fail(ErrorKind::Integrity,
                            -1,
                            "md5 mismatch: expected=" + expected_ + " actual=" + actual_);
    }
    return Result::Ok();
}

} // namespace ingest
