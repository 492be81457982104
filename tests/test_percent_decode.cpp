#include "http_utils.h"
#include <gtest/gtest.h>

using HttpUtils::DecodeError;

namespace {

std::string decodeOk(const std::string& input){
    std::string output;
    DecodeError error;
    EXPECT_TRUE(HttpUtils::percentDecode(input, &output, &error)) << input << ": " << error.message();
    return output;
}

DecodeError decodeFail(const std::string& input){
    std::string output = "untouched";
    DecodeError error;
    EXPECT_FALSE(HttpUtils::percentDecode(input, &output, &error)) << input;
    EXPECT_EQ("untouched", output);
    return error;
}

} // namespace

TEST(PercentDecodeTest, PlainTextUnchanged){
    EXPECT_EQ("index.html", decodeOk("index.html"));
    EXPECT_EQ("", decodeOk(""));
}

TEST(PercentDecodeTest, EscapesEitherCase){
    EXPECT_EQ("hello world.txt", decodeOk("hello%20world.txt"));
    EXPECT_EQ("a/b", decodeOk("a%2Fb"));
    EXPECT_EQ("a/b", decodeOk("a%2fb"));
    EXPECT_EQ("../secret.txt", decodeOk("%2e%2e/secret.txt"));
}

TEST(PercentDecodeTest, PlusIsNotSpace){
    EXPECT_EQ("a+b.txt", decodeOk("a+b.txt"));
}

TEST(PercentDecodeTest, MultiByteUtf8){
    EXPECT_EQ("\xe4\xb8\xad\xe6\x96\x87.html", decodeOk("%E4%B8%AD%E6%96%87.html"));
    EXPECT_EQ("\xf0\x9f\x98\x80", decodeOk("%F0%9F%98%80"));
    // 未转义的UTF-8原样通过
    EXPECT_EQ("\xc3\xa9", decodeOk("\xc3\xa9"));
}

TEST(PercentDecodeTest, MalformedEscape){
    DecodeError error = decodeFail("%zz");
    EXPECT_EQ(DecodeError::kMalformedEscape, error.kind);
    EXPECT_EQ(0u, error.offset);
    EXPECT_EQ("malformed percent-escape at index 0", error.message());

    EXPECT_EQ(DecodeError::kMalformedEscape, decodeFail("abc%4").kind);
    EXPECT_EQ(3u, decodeFail("abc%").offset);
    EXPECT_EQ(DecodeError::kMalformedEscape, decodeFail("%4g").kind);
}

TEST(PercentDecodeTest, StrayContinuationByte){
    DecodeError error = decodeFail("%80");
    EXPECT_EQ(DecodeError::kInvalidUtf8, error.kind);
    EXPECT_EQ(0u, error.offset);
    EXPECT_EQ(1u, error.length);
    EXPECT_EQ("invalid utf-8 sequence of 1 bytes from index 0", error.message());
}

TEST(PercentDecodeTest, InvalidUtf8OffsetIsInDecodedBytes){
    // "ab%FF" 解码后 0xFF 位于下标2
    DecodeError error = decodeFail("ab%FF");
    EXPECT_EQ(DecodeError::kInvalidUtf8, error.kind);
    EXPECT_EQ(2u, error.offset);
}

TEST(PercentDecodeTest, TruncatedSequence){
    DecodeError error = decodeFail("x%E4%B8");
    EXPECT_EQ(DecodeError::kInvalidUtf8, error.kind);
    EXPECT_EQ(1u, error.offset);
    EXPECT_EQ(0u, error.length);
    EXPECT_EQ("incomplete utf-8 byte sequence from index 1", error.message());
}

TEST(PercentDecodeTest, BrokenSequence){
    // 三字节序列的第三个字节不是续字节
    DecodeError error = decodeFail("%E4%B8A");
    EXPECT_EQ(2u, error.length);
}

TEST(PercentDecodeTest, RejectsOverlongSurrogateAndOutOfRange){
    EXPECT_EQ(DecodeError::kInvalidUtf8, decodeFail("%C0%AF").kind);         // 过长编码的'/'
    EXPECT_EQ(DecodeError::kInvalidUtf8, decodeFail("%E0%80%AF").kind);
    EXPECT_EQ(DecodeError::kInvalidUtf8, decodeFail("%ED%A0%80").kind);      // U+D800
    EXPECT_EQ(DecodeError::kInvalidUtf8, decodeFail("%F4%90%80%80").kind);   // > U+10FFFF
    EXPECT_EQ(DecodeError::kInvalidUtf8, decodeFail("%F5%80%80%80").kind);
}

TEST(PercentDecodeTest, NullErrorPointer){
    std::string output;
    EXPECT_FALSE(HttpUtils::percentDecode("%zz", &output, nullptr));
    EXPECT_FALSE(HttpUtils::validateUtf8("\xff", nullptr));
}
