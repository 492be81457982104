#pragma once
#include <string>
#include <unordered_map>

// 按扩展名确定Content-Type，不做内容协商
class MimeTypes{
public:
    // extension带点，如".html"，不区分大小写；未知扩展名返回application/octet-stream
    static std::string getMimeType(const std::string& extension);
private:
    static const std::unordered_map<std::string, std::string> mime_map_;
};
