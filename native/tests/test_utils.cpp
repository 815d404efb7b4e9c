/*
 * Unit tests for utility functions
 */
#include <gtest/gtest.h>
#include "../Base.h"
#include "../utils.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>

using namespace tapsight;

class UtilsTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(UtilsTest, StringReplaceAll) {
    std::string str = "it's a quote's quote";
    stringReplaceAll(str, "'", "'\\''");
    EXPECT_EQ(str, "it'\\''s a quote'\\''s quote");
}

TEST_F(UtilsTest, StringReplaceAll_NoMatch) {
    std::string str = "hello world";
    stringReplaceAll(str, "xyz", "abc");
    EXPECT_EQ(str, "hello world");
}

TEST_F(UtilsTest, StringReplaceAll_EmptyFrom) {
    std::string str = "hello";
    stringReplaceAll(str, "", "x");
    EXPECT_EQ(str, "hello");
}

TEST_F(UtilsTest, TrimString) {
    std::string str1 = "  hello  ";
    trimString(str1);
    EXPECT_EQ(str1, "hello");

    std::string str2 = "\t\nhello\n\t";
    trimString(str2);
    EXPECT_EQ(str2, "hello");

    std::string str3 = "   ";
    trimString(str3);
    EXPECT_EQ(str3, "");
}

TEST_F(UtilsTest, SplitString) {
    std::vector<std::string> result;
    splitString("a=b=c", result, '=');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[2], "c");
}

TEST_F(UtilsTest, SplitString_Empty) {
    std::vector<std::string> result;
    splitString("", result, '\n');
    EXPECT_TRUE(result.empty());
}

TEST_F(UtilsTest, SplitWords_CollapsesWhitespace) {
    std::vector<std::string> words = splitWords("  tap \t the   second\nvideo ");
    ASSERT_EQ(words.size(), 4u);
    EXPECT_EQ(words[0], "tap");
    EXPECT_EQ(words[3], "video");
    EXPECT_EQ(joinWords(words), "tap the second video");
    EXPECT_EQ(joinWords(words, ","), "tap,the,second,video");
}

TEST_F(UtilsTest, ToLowerCopy_KeepsMultiByte) {
    EXPECT_EQ(toLowerCopy("SUBSCRIBE Now"), "subscribe now");
    EXPECT_EQ(toLowerCopy("Caf\xC3\x89"), "caf\xC3\x89");
}

TEST_F(UtilsTest, SequenceSimilarity) {
    EXPECT_DOUBLE_EQ(sequenceSimilarity("subscribe", "subscribe"), 1.0);
    EXPECT_DOUBLE_EQ(sequenceSimilarity("", ""), 1.0);
    EXPECT_DOUBLE_EQ(sequenceSimilarity("abc", ""), 0.0);
    EXPECT_DOUBLE_EQ(sequenceSimilarity("abcd", "bcde"), 0.75);
    EXPECT_NEAR(sequenceSimilarity("settings", "setings"), 14.0 / 15.0, 1e-9);
    EXPECT_DOUBLE_EQ(sequenceSimilarity("abc", "xyz"), 0.0);
}

TEST_F(UtilsTest, Base64Encode) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("M"), "TQ==");
    EXPECT_EQ(base64Encode("Ma"), "TWE=");
    EXPECT_EQ(base64Encode("Man"), "TWFu");
    EXPECT_EQ(base64Encode(std::string("\x89PNG", 4)), "iVBORw==");
}

TEST_F(UtilsTest, GetTimeFormatStr) {
    std::string timeStr = getTimeFormatStr();
    // "YYYY-MM-DD HH:MM:SS.mmm"
    EXPECT_EQ(timeStr.size(), 23u);
}

TEST_F(UtilsTest, CurrentStamp) {
    double stamp1 = currentStamp();
    double stamp2 = currentStamp();
    EXPECT_GT(stamp1, 0.0);
    EXPECT_GE(stamp2, stamp1);
}

TEST_F(UtilsTest, GetJsonValue) {
    nlohmann::json j = {{"ttl", 3000}, {"model", "llava-phi3"}, {"empty", nullptr}};
    EXPECT_EQ(getJsonValue<int>(j, "ttl", 0), 3000);
    EXPECT_EQ(getJsonValue<std::string>(j, "model", ""), "llava-phi3");
    EXPECT_EQ(getJsonValue<int>(j, "missing", 7), 7);
    EXPECT_EQ(getJsonValue<int>(j, "empty", 7), 7);
    EXPECT_EQ(getJsonValue<int>(j, "model", 7), 7);
}

TEST_F(UtilsTest, LoadFileContent) {
    std::string path = ::testing::TempDir() + "tapsight_utils_test.txt";
    {
        std::ofstream out(path);
        out << "tapsight.screenshot.ttlMs=100\n";
    }
    EXPECT_EQ(loadFileContent(path), "tapsight.screenshot.ttlMs=100\n");
    std::remove(path.c_str());
    EXPECT_EQ(loadFileContent(path), "");
}
