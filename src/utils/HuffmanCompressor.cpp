#include "HuffmanCompressor.hpp"
#include <cstring>
#include <fstream>
#include <queue>

namespace {

const char HUFFMAN_MAGIC[4] = {'H', 'U', 'F', '2'};
const size_t CHUNK_SIZE = 64 * 1024;

template <typename T>
void writeValue(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
bool readValue(std::ifstream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return static_cast<bool>(in);
}

} // namespace

HuffmanCompressor::HuffmanCompressor() : root(nullptr) {}

HuffmanCompressor::~HuffmanCompressor() {
    delete root;
}

const std::string& HuffmanCompressor::getLastError() const {
    return lastError;
}

void HuffmanCompressor::resetTree() {
    delete root;
    root = nullptr;
}

HuffmanNode* HuffmanCompressor::buildHuffmanTree(const FrequencyTable& freq) {
    // 创建优先队列（最小堆）
    std::priority_queue<HuffmanNode*, std::vector<HuffmanNode*>, Compare> minHeap;

    // 叶子节点的次序就是字节值，按0..255的固定顺序加入
    for (unsigned int symbol = 0; symbol < 256; symbol++) {
        if (freq[symbol] > 0) {
            minHeap.push(new HuffmanNode(static_cast<unsigned char>(symbol), freq[symbol], symbol));
        }
    }
    if (minHeap.empty()) {
        return nullptr;
    }

    unsigned int nextOrder = 256;
    while (minHeap.size() > 1) {
        // 取出频率最小的两个节点
        HuffmanNode* left = minHeap.top();
        minHeap.pop();
        HuffmanNode* right = minHeap.top();
        minHeap.pop();

        // 合并为新的内部节点
        HuffmanNode* newNode = new HuffmanNode(0, left->freq + right->freq, nextOrder++);
        newNode->left = left;
        newNode->right = right;
        minHeap.push(newNode);
    }

    // 剩下的节点就是根节点
    return minHeap.top();
}

void HuffmanCompressor::generateCodes(HuffmanNode* node, const std::string& code, std::array<std::string, 256>& codes) {
    if (node == nullptr) {
        return;
    }

    // 如果是叶子节点，保存其编码；只有一种字节时用"0"
    if (node->isLeaf()) {
        codes[node->data] = code.empty() ? "0" : code;
        return;
    }

    // 递归遍历左右子树
    generateCodes(node->left, code + "0", codes);
    generateCodes(node->right, code + "1", codes);
}

bool HuffmanCompressor::compressFile(const std::string& inputFilePath, const std::string& outputFilePath) {
    lastError.clear();
    resetTree();

    // 1. 第一遍：统计字节频率
    std::ifstream inFile(inputFilePath, std::ios::binary);
    if (!inFile) {
        lastError = "cannot open input file " + inputFilePath;
        return false;
    }

    FrequencyTable freq{};
    uint64_t originalSize = 0;
    std::vector<char> buffer(CHUNK_SIZE);
    while (inFile) {
        inFile.read(buffer.data(), buffer.size());
        std::streamsize count = inFile.gcount();
        for (std::streamsize i = 0; i < count; i++) {
            freq[static_cast<unsigned char>(buffer[i])]++;
        }
        originalSize += static_cast<uint64_t>(count);
    }
    if (inFile.bad()) {
        lastError = "failed reading " + inputFilePath;
        return false;
    }

    // 2. 构建树和编码表
    root = buildHuffmanTree(freq);
    std::array<std::string, 256> codes;
    generateCodes(root, "", codes);

    // 3. 写入文件头和频率表
    std::ofstream outFile(outputFilePath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        lastError = "cannot create output file " + outputFilePath;
        return false;
    }
    outFile.write(HUFFMAN_MAGIC, sizeof(HUFFMAN_MAGIC));
    writeValue(outFile, originalSize);
    uint16_t symbolCount = 0;
    for (uint64_t f : freq) {
        if (f > 0) {
            symbolCount++;
        }
    }
    writeValue(outFile, symbolCount);
    for (unsigned int symbol = 0; symbol < 256; symbol++) {
        if (freq[symbol] > 0) {
            writeValue(outFile, static_cast<uint8_t>(symbol));
            writeValue(outFile, freq[symbol]);
        }
    }

    // 4. 第二遍：分块编码写出位流
    inFile.clear();
    inFile.seekg(0, std::ios::beg);
    std::vector<char> encoded;
    encoded.reserve(CHUNK_SIZE);
    unsigned char currentByte = 0;
    int bitCount = 0;
    while (inFile) {
        inFile.read(buffer.data(), buffer.size());
        std::streamsize count = inFile.gcount();
        for (std::streamsize i = 0; i < count; i++) {
            const std::string& code = codes[static_cast<unsigned char>(buffer[i])];
            for (char bit : code) {
                currentByte = static_cast<unsigned char>((currentByte << 1) | (bit == '1' ? 1 : 0));
                if (++bitCount == 8) {
                    encoded.push_back(static_cast<char>(currentByte));
                    currentByte = 0;
                    bitCount = 0;
                }
            }
        }
        if (encoded.size() >= CHUNK_SIZE) {
            outFile.write(encoded.data(), encoded.size());
            encoded.clear();
        }
    }
    if (inFile.bad()) {
        lastError = "failed reading " + inputFilePath;
        return false;
    }
    // 最后一个字节不足8位时低位补0
    if (bitCount > 0) {
        currentByte = static_cast<unsigned char>(currentByte << (8 - bitCount));
        encoded.push_back(static_cast<char>(currentByte));
    }
    outFile.write(encoded.data(), encoded.size());
    outFile.flush();
    if (!outFile) {
        lastError = "failed writing " + outputFilePath;
        return false;
    }
    return true;
}

bool HuffmanCompressor::decompressFile(const std::string& inputFilePath, const std::string& outputFilePath) {
    lastError.clear();
    resetTree();

    std::ifstream inFile(inputFilePath, std::ios::binary);
    if (!inFile) {
        lastError = "cannot open input file " + inputFilePath;
        return false;
    }

    // 1. 读取文件头和频率表
    char magic[sizeof(HUFFMAN_MAGIC)];
    inFile.read(magic, sizeof(magic));
    uint64_t originalSize = 0;
    uint16_t symbolCount = 0;
    if (!inFile || std::memcmp(magic, HUFFMAN_MAGIC, sizeof(magic)) != 0 ||
        !readValue(inFile, originalSize) || !readValue(inFile, symbolCount) || symbolCount > 256) {
        lastError = "not a Huffman compressed file: " + inputFilePath;
        return false;
    }
    FrequencyTable freq{};
    for (uint16_t i = 0; i < symbolCount; i++) {
        uint8_t symbol = 0;
        uint64_t f = 0;
        if (!readValue(inFile, symbol) || !readValue(inFile, f)) {
            lastError = "truncated frequency table in " + inputFilePath;
            return false;
        }
        freq[symbol] = f;
    }

    std::ofstream outFile(outputFilePath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        lastError = "cannot create output file " + outputFilePath;
        return false;
    }
    if (originalSize == 0) {
        return true;
    }

    // 2. 重建同一棵树
    root = buildHuffmanTree(freq);
    if (root == nullptr) {
        lastError = "empty frequency table in " + inputFilePath;
        return false;
    }

    std::vector<char> decoded;
    decoded.reserve(CHUNK_SIZE);
    uint64_t produced = 0;

    // 只有一种字节时不需要读取位流
    if (root->isLeaf()) {
        while (produced < originalSize) {
            decoded.push_back(static_cast<char>(root->data));
            produced++;
            if (decoded.size() >= CHUNK_SIZE) {
                outFile.write(decoded.data(), decoded.size());
                decoded.clear();
            }
        }
    } else {
        // 3. 按位遍历树解码
        std::vector<char> buffer(CHUNK_SIZE);
        HuffmanNode* current = root;
        while (produced < originalSize && inFile) {
            inFile.read(buffer.data(), buffer.size());
            std::streamsize count = inFile.gcount();
            for (std::streamsize i = 0; i < count && produced < originalSize; i++) {
                unsigned char byte = static_cast<unsigned char>(buffer[i]);
                for (int bit = 7; bit >= 0 && produced < originalSize; bit--) {
                    current = ((byte >> bit) & 1) ? current->right : current->left;
                    if (current->isLeaf()) {
                        decoded.push_back(static_cast<char>(current->data));
                        produced++;
                        current = root;
                    }
                }
            }
            if (decoded.size() >= CHUNK_SIZE) {
                outFile.write(decoded.data(), decoded.size());
                decoded.clear();
            }
        }
    }

    outFile.write(decoded.data(), decoded.size());
    outFile.flush();
    if (produced != originalSize) {
        lastError = "compressed stream ended early in " + inputFilePath;
        return false;
    }
    if (!outFile) {
        lastError = "failed writing " + outputFilePath;
        return false;
    }
    return true;
}
