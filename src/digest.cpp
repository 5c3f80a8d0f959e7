#include "admit/digest.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cerrno>
#include <vector>

namespace admit {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static const char* he = "0123456789abcdef";
    std::string s;
    s.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        s[2 * i] = he[bytes[i] >> 4];
        s[2 * i + 1] = he[bytes[i] & 0xF];
    }
    return s;
}

Result RandomHex(size_t n, std::string& out) {
    std::vector<std::uint8_t> buf(n);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return Result::Fail(EIO, "RAND_bytes failed");
    }
    out = HexEncode(buf);
    return Result::Ok();
}

void Sha256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    if (ctx) EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1) ready_ = true;
}

Sha256::~Sha256() = default;

Result Sha256::Update(std::span<const std::uint8_t> bytes) {
    if (!ready_) return Result::Fail(EINVAL, "sha256 context not ready");
    if (bytes.empty()) return Result::Ok();
    if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
        return Result::Fail(EIO, "EVP_DigestUpdate failed");
    }
    return Result::Ok();
}

Result Sha256::Final(std::string& hex_out) {
    if (!ready_) return Result::Fail(EINVAL, "sha256 context not ready");
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    ready_ = false;
    if (EVP_DigestFinal_ex(ctx_.get(), md, &len) != 1) {
        return Result::Fail(EIO, "EVP_DigestFinal_ex failed");
    }
    hex_out = HexEncode(std::span<const std::uint8_t>(md, len));
    return Result::Ok();
}

Result Sha256::Of(std::span<const std::uint8_t> bytes, std::string& hex_out) {
    Sha256 h;
    auto r = h.Update(bytes);
    if (!r.is_ok()) return r;
    return h.Final(hex_out);
}

} // namespace admit
