#include "Crypto.hpp"

#include "../debug/log.hpp"

#include <vector>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <fmt/format.h>

std::string NCrypto::sha256(const std::string& in) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx)
        return "";

    if (!EVP_DigestInit(ctx, EVP_sha256())) {
        Debug::log(ERR, "NCrypto::sha256: EVP_DigestInit: err {}", ERR_error_string(ERR_get_error(), nullptr));
        EVP_MD_CTX_free(ctx);
        return "";
    }

    if (!EVP_DigestUpdate(ctx, in.c_str(), in.size())) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    uint8_t buf[32];

    if (!EVP_DigestFinal(ctx, buf, nullptr)) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    std::stringstream ss;
    for (size_t i = 0; i < 32; ++i) {
        ss << fmt::format("{:02x}", buf[i]);
    }

    EVP_MD_CTX_free(ctx);

    return ss.str();
}

std::string NCrypto::randomHex(size_t bytes) {
    std::vector<uint8_t> buf;
    buf.resize(bytes);

    if (RAND_bytes(buf.data(), (int)buf.size()) != 1) {
        Debug::log(CRIT, "NCrypto::randomHex: RAND_bytes: err {}", ERR_error_string(ERR_get_error(), nullptr));
        throw std::runtime_error("CSPRNG failure");
    }

    std::stringstream ss;
    for (const auto& b : buf) {
        ss << fmt::format("{:02x}", b);
    }

    return ss.str();
}
