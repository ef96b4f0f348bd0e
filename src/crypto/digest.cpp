#include "crypto/digest.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <vector>

namespace ingest {

namespace {

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

const EVP_MD* MdFor(DigestAlgorithm algo) {
    switch (algo) {
        case DigestAlgorithm::Md5:    return EVP_md5();
        case DigestAlgorithm::Sha256: return EVP_sha256();
    }
    return nullptr;
}

bool InitDigest(EvpCtx& ctx, DigestAlgorithm algo) {
    const EVP_MD* md = MdFor(algo);
    return ctx.ok() && md && EVP_DigestInit_ex(ctx.get(), md, nullptr) == 1;
}

bool UpdateDigest(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

std::string FinalDigestHex(EvpCtx& ctx) {
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return {};
    return HexEncode(std::span<const std::uint8_t>(out.data(), len));
}

std::string OneShotHex(DigestAlgorithm algo, std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!InitDigest(ctx, algo)) return {};
    if (!UpdateDigest(ctx, data)) return {};
    return FinalDigestHex(ctx);
}

} // namespace

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

struct Hasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool finalized = false;
};

Hasher::Hasher(DigestAlgorithm algo) : impl_(std::make_unique<Impl>()) {
    if (InitDigest(impl_->ctx, algo)) {
        impl_->initialized = true;
    }
}

Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;
Hasher::~Hasher() = default;

bool Hasher::Good() const {
    return impl_ && impl_->initialized && !impl_->finalized;
}

void Hasher::Update(std::span<const std::uint8_t> data) {
    if (!Good()) return;
    if (!UpdateDigest(impl_->ctx, data)) {
        impl_->initialized = false;
    }
}

std::string Hasher::FinalHex() {
    if (!Good()) return {};
    impl_->finalized = true;
    return FinalDigestHex(impl_->ctx);
}

std::string Md5Hex(std::span<const std::uint8_t> data) {
    return OneShotHex(DigestAlgorithm::Md5, data);
}

std::string Md5Hex(IReader& reader) {
    Hasher hasher(DigestAlgorithm::Md5);
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    return hasher.FinalHex();
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    return OneShotHex(DigestAlgorithm::Sha256, data);
}

std::string Sha256Hex(std::string_view data) {
    return Sha256Hex(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

std::array<std::uint8_t, 32> HmacSha256(std::span<const std::uint8_t> key, std::string_view data) {
    std::array<std::uint8_t, 32> out{};
    unsigned int len = 0;
    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         out.data(),
         &len);
    return out;
}

} // namespace ingest
