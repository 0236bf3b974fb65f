#pragma once
#include <string>

// 基于OpenSSL EVP的内容摘要
class ContentHasher {
public:
    // 计算文件的SHA-256，成功时写入十六进制小写摘要
    static bool sha256File(const std::string& filePath, std::string& hexDigest);
};
