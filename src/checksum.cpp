// checksum.cpp - SHA-256 file digests implementation
// Uses the OpenSSL EVP interface

#include "checksum.hpp"
#include "logger.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <vector>

namespace koboshelf {
namespace checksum {

std::string sha256_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Logger::warn("[Checksum] Cannot open for hashing: " + path);
        return {};
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        Logger::error("[Checksum] Failed to create digest context");
        return {};
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        Logger::error("[Checksum] Failed to initialize SHA-256");
        return {};
    }

    std::vector<char> buffer(READ_CHUNK_SIZE);
    while (in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        if (EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(got)) != 1) {
            EVP_MD_CTX_free(ctx);
            Logger::error("[Checksum] Digest update failed for: " + path);
            return {};
        }
    }

    if (in.bad()) {
        EVP_MD_CTX_free(ctx);
        Logger::warn("[Checksum] Read error while hashing: " + path);
        return {};
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digest_len) != 1) {
        EVP_MD_CTX_free(ctx);
        Logger::error("[Checksum] Digest finalization failed for: " + path);
        return {};
    }
    EVP_MD_CTX_free(ctx);

    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 0x0F]);
    }
    return result;
}

bool files_match(const std::string& a, const std::string& b) {
    std::string ha = sha256_file(a);
    if (ha.empty()) return false;
    std::string hb = sha256_file(b);
    if (hb.empty()) return false;
    return ha == hb;
}

} // namespace checksum
} // namespace koboshelf
