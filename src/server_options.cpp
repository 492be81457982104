#include "server_options.h"
#include "utils/config.h"
#include <stdexcept>

namespace {

uint16_t toPort(const Config& config, const std::string& key, int default_port){
    int port = config.getInt("server", key, default_port);
    if(port <= 0 || port > 65535){
        throw std::invalid_argument("[server] " + key + " out of range: " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

} // namespace

ServerOptions ServerOptions::fromConfig(const Config& config){
    ServerOptions options;

    options.http_port = toPort(config, "http_port", options.http_port);
    options.threads = config.getInt("server", "threads", options.threads);
    if(options.threads < 0){
        throw std::invalid_argument("[server] threads must not be negative");
    }
    options.idle_timeout_sec = config.getInt("server", "idle_timeout_sec", 60);

    options.enable_ssl = config.getBool("server", "enable_ssl", false);
    if(options.enable_ssl){
        options.https_port = toPort(config, "https_port", options.https_port);
        options.cert_path = config.getString("ssl", "cert_path");
        options.key_path = config.getString("ssl", "key_path");
        if(options.cert_path.empty() || options.key_path.empty()){
            throw std::invalid_argument("enable_ssl requires [ssl] cert_path and key_path");
        }
    }

    if(config.hasKey("static", "roots")){
        options.static_roots = config.getList("static", "roots");
    }

    options.log_level = config.getString("logging", "log_level", options.log_level);
    options.log_basename = config.getString("logging", "basename");
    int roll_size_mb = config.getInt("logging", "roll_size_mb", 500);
    if(roll_size_mb <= 0){
        throw std::invalid_argument("[logging] roll_size_mb must be positive");
    }
    options.log_roll_size = static_cast<off_t>(roll_size_mb) * 1024 * 1024;
    options.log_flush_interval_sec = config.getInt("logging", "flush_interval_sec", 3);
    if(options.log_flush_interval_sec <= 0){
        options.log_flush_interval_sec = 3;
    }
    return options;
}
