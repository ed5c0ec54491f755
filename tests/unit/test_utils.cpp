#include <gtest/gtest.h>
#include "ed2kwire/core/utils.hpp"
#include <filesystem>
#include <fstream>

using namespace ed2kwire::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Join) {
    std::vector<std::string> parts = {"a", "b", "c"};
    EXPECT_EQ(StringUtils::join(parts, ", "), "a, b, c");

    std::vector<std::string> empty;
    EXPECT_EQ(StringUtils::join(empty, ","), "");
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("\thello\r\n"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
}

TEST_F(StringUtilsTest, ToHex) {
    std::vector<std::uint8_t> bytes = {0x00, 0xE3, 0x7f, 0xFF};
    EXPECT_EQ(StringUtils::to_hex(bytes), "00E37FFF");
    EXPECT_EQ(StringUtils::to_hex({}), "");
}

TEST_F(StringUtilsTest, FromHex) {
    auto bytes = StringUtils::from_hex("e3 05 00\n00 00 14");
    ASSERT_TRUE(bytes.has_value());
    std::vector<std::uint8_t> expected = {0xE3, 0x05, 0x00, 0x00, 0x00, 0x14};
    EXPECT_EQ(*bytes, expected);

    auto empty = StringUtils::from_hex("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(StringUtilsTest, FromHexRejectsMalformedInput) {
    EXPECT_FALSE(StringUtils::from_hex("E3Z0").has_value());
    EXPECT_FALSE(StringUtils::from_hex("E30").has_value());
    EXPECT_FALSE(StringUtils::from_hex("E 3").has_value());
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_ed2kwire_capture.bin";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(FileUtilsTest, ReadBinaryFile) {
    std::vector<std::uint8_t> content = {0xE3, 0x00, 0x0A, 0x0D, 0xFF};
    {
        std::ofstream file(test_file, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
    }

    EXPECT_TRUE(FileUtils::exists(test_file));

    auto loaded = FileUtils::read_binary_file(test_file);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, content);
}

TEST_F(FileUtilsTest, MissingFile) {
    EXPECT_FALSE(FileUtils::exists(test_file));
    EXPECT_FALSE(FileUtils::read_binary_file(test_file).has_value());
}
