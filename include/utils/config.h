#pragma once
#include "utils/noncopyable.h"
#include <map>
#include <string>
#include <vector>

// A simple INI file parser
class Config : NonCopyable {
public:
    using Section = std::map<std::string, std::string>;

    Config() = default;
    ~Config() = default;

    // 加载并解析INI文件，文件打不开时返回false
    bool load(const std::string& filename);
    // 直接解析内存中的INI文本
    void parse(const std::string& content);

    std::string getString(const std::string& section, const std::string& key, const std::string& default_value = "") const;
    int getInt(const std::string& section, const std::string& key, int default_value = 0) const;

    // "true"/"yes"/"on"/"1" 为真，"false"/"no"/"off"/"0" 为假(不区分大小写)
    // 其他值返回default_value
    bool getBool(const std::string& section, const std::string& key, bool default_value = false) const;

    // 逗号分隔的列表，每项去掉首尾空白，空项被忽略
    std::vector<std::string> getList(const std::string& section, const std::string& key) const;

    // 整个节，不存在时返回空表
    const Section& getSection(const std::string& section) const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    static std::string trim(const std::string& str);

private:
    void parseLine(const std::string& raw, std::string* current_section);

    // map<section, map<key, value>>
    std::map<std::string, Section> data_;
};
