#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace ingest {

enum class DigestAlgorithm {
    Md5,
    Sha256,
};

std::string HexEncode(std::span<const std::uint8_t> bytes);

std::string Md5Hex(std::span<const std::uint8_t> data);
std::string Md5Hex(IReader& reader);
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(std::string_view data);

std::array<std::uint8_t, 32> HmacSha256(std::span<const std::uint8_t> key, std::string_view data);

// Incremental digest over an OpenSSL EVP context.
class Hasher {
public:
    explicit Hasher(DigestAlgorithm algo);
    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;
    ~Hasher();

    // False once the context has failed; FinalHex() then returns "".
    bool Good() const;

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ingest
