#include "ContentHasher.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <vector>

namespace {

std::string toHex(const unsigned char* data, unsigned int length) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; i++) {
        hex.push_back(digits[(data[i] >> 4) & 0x0F]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

} // namespace

bool ContentHasher::sha256File(const std::string& filePath, std::string& hexDigest) {
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        return false;
    }

    // 创建摘要上下文
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return false;
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return false;
    }

    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize count = in.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(count)) != 1) {
            EVP_MD_CTX_free(ctx);
            return false;
        }
    }
    if (in.bad()) {
        EVP_MD_CTX_free(ctx);
        return false;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digestLength) != 1) {
        EVP_MD_CTX_free(ctx);
        return false;
    }
    EVP_MD_CTX_free(ctx);

    hexDigest = toHex(digest, digestLength);
    return true;
}
