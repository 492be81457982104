#pragma once
#include <cstddef>
#include <string>

namespace HttpUtils{

// 百分号解码失败的原因
struct DecodeError{
    enum Kind{
        kMalformedEscape, // '%'后面不是两个十六进制数字
        kInvalidUtf8,     // 解码后的字节不是合法的UTF-8
    };

    Kind kind = kMalformedEscape;
    // kMalformedEscape: '%'在输入中的位置
    // kInvalidUtf8: 出错序列在解码结果中的起始位置
    size_t offset = 0;
    // 非法UTF-8序列的字节数；为0表示输入在一个不完整的序列中结束
    size_t length = 0;

    std::string message() const;
};

// 把"%XX"解码为原始字节，再按UTF-8校验
// 成功时把结果写入output并返回true；失败时填写error(可为nullptr)并返回false，output不变
// '+'保持原样，它只在表单编码中表示空格
bool percentDecode(const std::string& input, std::string* output, DecodeError* error);

// UTF-8校验，规则与RFC 3629一致: 拒绝过长编码、代理区码点和大于U+10FFFF的码点
// 失败时error记录出错位置和长度
bool validateUtf8(const std::string& bytes, DecodeError* error);

} // namespace HttpUtils
