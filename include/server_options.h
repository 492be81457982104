#pragma once
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

class Config;

// 启动参数，来自INI文件的[server] [ssl] [static] [logging]节
struct ServerOptions{
    uint16_t http_port = 8080;
    int threads = 0;
    double idle_timeout_sec = 60;

    bool enable_ssl = false;
    uint16_t https_port = 8443;
    std::string cert_path;
    std::string key_path;

    // 按顺序串联的静态文件根目录
    std::vector<std::string> static_roots{"www"};

    std::string log_level = "INFO";
    std::string log_basename; // 为空时日志输出到stdout
    off_t log_roll_size = 500 * 1024 * 1024;
    int log_flush_interval_sec = 3;

    // 取值不合法(端口越界、线程数为负、开启SSL却缺少证书)时抛出std::invalid_argument
    static ServerOptions fromConfig(const Config& config);
};
