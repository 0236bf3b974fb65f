#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>
#include "utils/HuffmanCompressor.hpp"

namespace fs = std::filesystem;

// HuffmanCompressor类测试用例
class HuffmanCompressorTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "snapshotd_huffman_test";
    fs::path testFile = testDir / "test.txt";
    fs::path compressedFile = testDir / "test.txt.huff";
    fs::path decompressedFile = testDir / "test_decompressed.txt";

    void SetUp() override {
        fs::create_directories(testDir);
        std::ofstream testStream(testFile);
        testStream << "This is a test file for Huffman compression. "
                   << "It contains multiple lines of text. "
                   << "The compression algorithm should reduce the file size.";
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    static std::string readAll(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    // 压缩再解压，返回解压后的内容
    std::string roundTrip(const fs::path& input) {
        HuffmanCompressor compressor;
        fs::path packed = testDir / (input.filename().string() + ".huff");
        fs::path unpacked = testDir / (input.filename().string() + ".out");
        EXPECT_TRUE(compressor.compressFile(input.string(), packed.string())) << compressor.getLastError();
        EXPECT_TRUE(compressor.decompressFile(packed.string(), unpacked.string())) << compressor.getLastError();
        return readAll(unpacked);
    }
};

// 测试压缩和解压缩功能
TEST_F(HuffmanCompressorTest, CompressDecompress) {
    EXPECT_EQ(roundTrip(testFile), readAll(testFile));
}

// 重复度高的文本压缩后应当变小
TEST_F(HuffmanCompressorTest, CompressesRedundantText) {
    fs::path redundant = testDir / "redundant.txt";
    {
        std::ofstream out(redundant);
        for (int i = 0; i < 2000; i++) {
            out << "aaaaaaaabbbbcc";
        }
    }
    HuffmanCompressor compressor;
    ASSERT_TRUE(compressor.compressFile(redundant.string(), compressedFile.string()));
    EXPECT_LT(fs::file_size(compressedFile), fs::file_size(redundant) / 2);
    ASSERT_TRUE(compressor.decompressFile(compressedFile.string(), decompressedFile.string()));
    EXPECT_EQ(readAll(decompressedFile), readAll(redundant));
}

// 测试空文件压缩
TEST_F(HuffmanCompressorTest, CompressEmptyFile) {
    fs::path emptyFile = testDir / "empty.txt";
    std::ofstream(emptyFile.string());
    EXPECT_EQ(roundTrip(emptyFile), "");
}

// 只有一种字节的文件
TEST_F(HuffmanCompressorTest, CompressSingleSymbolFile) {
    fs::path single = testDir / "single.txt";
    std::ofstream(single) << std::string(1000, 'z');
    EXPECT_EQ(roundTrip(single), std::string(1000, 'z'));
}

// 测试二进制文件压缩，跨越多个读缓冲块
TEST_F(HuffmanCompressorTest, CompressBinaryFile) {
    fs::path binaryFile = testDir / "binary.dat";
    {
        std::ofstream binaryStream(binaryFile, std::ios::binary);
        std::mt19937 generator(42);
        std::uniform_int_distribution<int> byte(0, 255);
        for (int i = 0; i < 300000; ++i) {
            binaryStream.put(static_cast<char>(byte(generator)));
        }
    }
    EXPECT_EQ(roundTrip(binaryFile), readAll(binaryFile));
}

TEST_F(HuffmanCompressorTest, RejectsForeignInput) {
    HuffmanCompressor compressor;
    EXPECT_FALSE(compressor.decompressFile(testFile.string(), decompressedFile.string()));
    EXPECT_FALSE(compressor.getLastError().empty());
}

TEST_F(HuffmanCompressorTest, RejectsTruncatedInput) {
    HuffmanCompressor compressor;
    ASSERT_TRUE(compressor.compressFile(testFile.string(), compressedFile.string()));
    fs::resize_file(compressedFile, fs::file_size(compressedFile) - 4);
    EXPECT_FALSE(compressor.decompressFile(compressedFile.string(), decompressedFile.string()));
}

// 测试不存在的文件压缩
TEST_F(HuffmanCompressorTest, CompressNonExistentFile) {
    HuffmanCompressor compressor;
    EXPECT_FALSE(compressor.compressFile((testDir / "missing.txt").string(), compressedFile.string()));
}

// 测试不存在的文件解压缩
TEST_F(HuffmanCompressorTest, DecompressNonExistentFile) {
    HuffmanCompressor compressor;
    EXPECT_FALSE(compressor.decompressFile((testDir / "missing.huff").string(), decompressedFile.string()));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
