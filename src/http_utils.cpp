#include "http_utils.h"
#include <utility>

namespace HttpUtils {

namespace {

int hexValue(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isContinuation(unsigned char c){
    return (c & 0xC0) == 0x80;
}

// 首字节决定的序列长度，0表示不可能出现在首位
int sequenceWidth(unsigned char c){
    if(c < 0x80) return 1;
    if(c >= 0xC2 && c <= 0xDF) return 2;
    if(c >= 0xE0 && c <= 0xEF) return 3;
    if(c >= 0xF0 && c <= 0xF4) return 4;
    return 0;
}

// 第二个字节的合法范围取决于首字节，借此排除过长编码、代理区和超范围码点
bool secondByteValid(unsigned char first, unsigned char second){
    switch(first){
        case 0xE0: return second >= 0xA0 && second <= 0xBF;
        case 0xED: return second >= 0x80 && second <= 0x9F;
        case 0xF0: return second >= 0x90 && second <= 0xBF;
        case 0xF4: return second >= 0x80 && second <= 0x8F;
        default: return isContinuation(second);
    }
}

bool fail(DecodeError* error, DecodeError::Kind kind, size_t offset, size_t length){
    if(error){
        error->kind = kind;
        error->offset = offset;
        error->length = length;
    }
    return false;
}

} // namespace

std::string DecodeError::message() const {
    if(kind == kMalformedEscape){
        return "malformed percent-escape at index " + std::to_string(offset);
    }
    if(length == 0){
        return "incomplete utf-8 byte sequence from index " + std::to_string(offset);
    }
    return "invalid utf-8 sequence of " + std::to_string(length) + " bytes from index " + std::to_string(offset);
}

bool validateUtf8(const std::string& bytes, DecodeError* error){
    const size_t n = bytes.size();
    size_t i = 0;
    while(i < n){
        unsigned char first = static_cast<unsigned char>(bytes[i]);
        int width = sequenceWidth(first);
        if(width == 1){
            ++i;
            continue;
        }
        if(width == 0){
            return fail(error, DecodeError::kInvalidUtf8, i, 1);
        }
        // 逐字节检查，length为已确认属于该序列的字节数
        for(int k = 1; k < width; ++k){
            if(i + k >= n){
                return fail(error, DecodeError::kInvalidUtf8, i, 0);
            }
            unsigned char c = static_cast<unsigned char>(bytes[i + k]);
            bool ok = (k == 1) ? secondByteValid(first, c) : isContinuation(c);
            if(!ok){
                return fail(error, DecodeError::kInvalidUtf8, i, static_cast<size_t>(k));
            }
        }
        i += width;
    }
    return true;
}

bool percentDecode(const std::string& input, std::string* output, DecodeError* error){
    std::string decoded;
    decoded.reserve(input.size());
    for(size_t i = 0; i < input.size(); ++i){
        if(input[i] != '%'){
            decoded += input[i];
            continue;
        }
        if(i + 2 >= input.size()){
            return fail(error, DecodeError::kMalformedEscape, i, 0);
        }
        int hi = hexValue(input[i + 1]);
        int lo = hexValue(input[i + 2]);
        if(hi < 0 || lo < 0){
            return fail(error, DecodeError::kMalformedEscape, i, 0);
        }
        decoded += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    if(!validateUtf8(decoded, error)){
        return false;
    }
    *output = std::move(decoded);
    return true;
}

} // namespace HttpUtils
