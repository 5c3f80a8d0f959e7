#pragma once

#include "admit/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

struct evp_md_ctx_st;

namespace admit {

std::string HexEncode(std::span<const std::uint8_t> bytes);

// Lowercase hex of n bytes from the OpenSSL CSPRNG.
Result RandomHex(size_t n, std::string& out);

// Incremental SHA-256 over libcrypto's EVP interface.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Result Update(std::span<const std::uint8_t> bytes);

    // Lowercase hex digest. The hasher cannot be updated afterwards.
    Result Final(std::string& hex_out);

    static Result Of(std::span<const std::uint8_t> bytes, std::string& hex_out);

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool ready_ = false;
};

} // namespace admit
