#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Huffman节点结构体
struct HuffmanNode {
    unsigned char data;     // 叶子节点存储的字节值
    uint64_t freq;          // 出现频率
    unsigned int order;     // 频率相同时的稳定次序，保证压缩和解压建出同一棵树
    HuffmanNode* left;      // 左子节点
    HuffmanNode* right;     // 右子节点

    HuffmanNode(unsigned char data, uint64_t freq, unsigned int order)
        : data(data), freq(freq), order(order), left(nullptr), right(nullptr) {}
    ~HuffmanNode() {
        delete left;
        delete right;
    }

    bool isLeaf() const {
        return left == nullptr && right == nullptr;
    }
};

// 比较器，用于优先队列（最小堆）
struct Compare {
    bool operator()(const HuffmanNode* l, const HuffmanNode* r) const {
        if (l->freq != r->freq) {
            return l->freq > r->freq;
        }
        return l->order > r->order;
    }
};

// 两遍扫描的Huffman文件压缩：第一遍统计频率，第二遍分块编码
// 输出格式：魔数"HUF2" | 原始长度(u64) | 符号数(u16) | (符号u8, 频率u64)... | 位流
class HuffmanCompressor {
public:
    HuffmanCompressor();
    ~HuffmanCompressor();

    HuffmanCompressor(const HuffmanCompressor&) = delete;
    HuffmanCompressor& operator=(const HuffmanCompressor&) = delete;

    // 压缩文件
    bool compressFile(const std::string& inputFilePath, const std::string& outputFilePath);

    // 解压文件
    bool decompressFile(const std::string& inputFilePath, const std::string& outputFilePath);

    const std::string& getLastError() const;

private:
    using FrequencyTable = std::array<uint64_t, 256>;

    // 按频率表构建Huffman树，频率全为0时返回nullptr
    HuffmanNode* buildHuffmanTree(const FrequencyTable& freq);

    // 生成Huffman编码（'0'/'1'组成的位串）
    void generateCodes(HuffmanNode* node, const std::string& code, std::array<std::string, 256>& codes);

    void resetTree();

    HuffmanNode* root;  // Huffman树的根节点
    std::string lastError;
};
