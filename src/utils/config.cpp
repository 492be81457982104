#include "utils/config.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

bool Config::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream content;
    content << file.rdbuf();
    parse(content.str());
    return true;
}

void Config::parse(const std::string& content) {
    data_.clear();
    std::istringstream in(content);
    std::string line;
    std::string current_section;
    while (std::getline(in, line)) {
        parseLine(line, &current_section);
    }
}

void Config::parseLine(const std::string& raw, std::string* current_section) {
    std::string line = trim(raw);

    // 忽略空行和注释
    if (line.empty() || line[0] == ';' || line[0] == '#') {
        return;
    }

    if (line[0] == '[' && line.back() == ']') {
        *current_section = trim(line.substr(1, line.length() - 2));
        return;
    }

    size_t delimiter_pos = line.find('=');
    if (delimiter_pos == std::string::npos) {
        return;
    }
    std::string key = trim(line.substr(0, delimiter_pos));
    std::string value = trim(line.substr(delimiter_pos + 1));

    // 行尾注释: "8080 ; http端口"
    size_t comment_pos = value.find_first_of(";#");
    if (comment_pos != std::string::npos) {
        value = trim(value.substr(0, comment_pos));
    }

    if (!current_section->empty() && !key.empty()) {
        data_[*current_section][key] = value;
    }
}

std::string Config::getString(const std::string& section, const std::string& key, const std::string& default_value) const {
    auto section_it = data_.find(section);
    if (section_it != data_.end()) {
        auto key_it = section_it->second.find(key);
        if (key_it != section_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}

int Config::getInt(const std::string& section, const std::string& key, int default_value) const {
    std::string value_str = getString(section, key);
    if (value_str.empty()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(value_str, &consumed);
        return consumed == value_str.size() ? value : default_value;
    } catch (const std::invalid_argument&) {
        return default_value;
    } catch (const std::out_of_range&) {
        return default_value;
    }
}

bool Config::getBool(const std::string& section, const std::string& key, bool default_value) const {
    std::string value_str = getString(section, key);
    if (value_str.empty()) {
        return default_value;
    }
    std::transform(value_str.begin(), value_str.end(), value_str.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    if (value_str == "true" || value_str == "yes" || value_str == "on" || value_str == "1") {
        return true;
    }
    if (value_str == "false" || value_str == "no" || value_str == "off" || value_str == "0") {
        return false;
    }
    return default_value;
}

std::vector<std::string> Config::getList(const std::string& section, const std::string& key) const {
    std::vector<std::string> items;
    std::stringstream ss(getString(section, key));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

const Config::Section& Config::getSection(const std::string& section) const {
    static const Section kEmpty;
    auto it = data_.find(section);
    return it == data_.end() ? kEmpty : it->second;
}

bool Config::hasSection(const std::string& section) const {
    return data_.find(section) != data_.end();
}

bool Config::hasKey(const std::string& section, const std::string& key) const {
    auto section_it = data_.find(section);
    if (section_it != data_.end()) {
        return section_it->second.find(key) != section_it->second.end();
    }
    return false;
}

std::string Config::trim(const std::string& str) {
    const std::string whitespace = " \t\n\r\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, (last - first + 1));
}
