#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <openssl/evp.h>
#include <memory>
#include <vector>

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string calculate_sha256(std::string_view data) {
    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw CdnsnipException(get_string("error.openssl_ctx_failed"));
    }

    if (EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), NULL) != 1) {
        throw CdnsnipException(get_string("error.openssl_init_failed"));
    }

    if (EVP_DigestUpdate(md_ctx.get(), data.data(), data.size()) != 1) {
        throw CdnsnipException(get_string("error.openssl_update_failed"));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len;
    if (EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len) != 1) {
        throw CdnsnipException(get_string("error.openssl_final_failed"));
    }

    return std::string(reinterpret_cast<const char*>(hash), hash_len);
}

std::string base64_encode(std::string_view data) {
    // 4 output bytes per 3 input bytes, plus the terminating NUL written by OpenSSL
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), written);
}

std::string sha256_integrity(std::string_view data) {
    return "sha256-" + base64_encode(calculate_sha256(data));
}

bool verify_integrity(std::string_view data, const std::string& integrity) {
    return sha256_integrity(data) == integrity;
}
