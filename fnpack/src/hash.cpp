#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <fstream>
#include <memory>

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string to_hex(const unsigned char* digest, unsigned int length) {
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

} // anonymous namespace

std::string calculate_sha256(const fs::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw FnpackException(string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw FnpackException(get_string("error.openssl_ctx_failed"));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw FnpackException(get_string("error.openssl_init_failed"));
    }

    std::array<char, 16384> buffer{};
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
            throw FnpackException(get_string("error.openssl_update_failed"));
        }
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        throw FnpackException(get_string("error.openssl_final_failed"));
    }
    return to_hex(digest.data(), digest_len);
}
