#include "crypto/sha256.hpp"

#include "io/fd.hpp"

#include <openssl/evp.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace repack {

namespace {

constexpr size_t kDigestLen = 32;
constexpr size_t kReadChunk = 64 * 1024;

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string ToHex(const unsigned char* bytes, size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[i * 2] = kHex[bytes[i] >> 4];
        out[i * 2 + 1] = kHex[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace

// A context that failed to initialize or update is dropped; FinalHex then
// returns an empty string.
struct Sha256Hasher::Impl {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    impl_->ctx.reset(EVP_MD_CTX_new());
    if (impl_->ctx && EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        impl_->ctx.reset();
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->ctx || data.empty()) return;
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->ctx.reset();
    }
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || !impl_->ctx) return {};
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    const bool ok = EVP_DigestFinal_ex(impl_->ctx.get(), digest, &len) == 1;
    impl_->ctx.reset();
    if (!ok || len != kDigestLen) return {};
    return ToHex(digest, len);
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    hasher.Update(data);
    return hasher.FinalHex();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        const int err = errno;
        return Result::Fail(err, "cannot open " + path + ": " + std::strerror(err));
    }

    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(kReadChunk);
    for (;;) {
        const ssize_t n = ::read(fd.Get(), buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(err, "cannot read " + path + ": " + std::strerror(err));
        }
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }

    out_hex = hasher.FinalHex();
    if (out_hex.empty()) return Result::Fail(-1, "sha256 of " + path + " failed");
    return Result::Ok();
}

} // namespace repack
