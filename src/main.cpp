#include "server.h"
#include "server_options.h"
#include "http/middleware.h"
#include "http/static_files_handler.h"
#include "http_request.h"
#include "http_response.h"
#include "net/event_loop.h"
#include "utils/async_logging.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

std::unique_ptr<AsyncLogging> g_async_log;
MiddlewareChain g_chain;
ServerOptions g_options;

void asyncOutput(const char* msg, int len) {
    if (g_async_log) {
        g_async_log->append(msg, len);
    }
}

void sendBadRequest(const std::shared_ptr<Connection>& conn){
    HttpResponse response;
    response.setPlainText(HttpResponse::k400BadRequest, "400 Bad Request\n");
    response.addHeader("Server", "filegate");
    response.setKeepAlive(false);
    Buffer response_buf;
    response.appendToBuffer(&response_buf);
    conn->send(&response_buf);
    conn->shutdown();
}

// 设置给Server的MessageCallback，一次读事件中可能有多个流水线请求
void onMessage(const std::shared_ptr<Connection>& conn, Buffer* buf){
    HttpRequest& request = conn->getRequest();
    while(buf->readableBytes() > 0){
        if(!request.parse(buf)){
            LOG_DEBUG << "Malformed request from " << conn->getPeerAddrStr();
            sendBadRequest(conn);
            request.reset();
            return;
        }
        if(!request.gotAll()){
            break; // 数据不完整，等待更多数据
        }

        HttpResponse response;
        response.addHeader("Server", "filegate");
        bool keep_alive = request.keepAlive();
        response.setKeepAlive(keep_alive);
        if(keep_alive){
            response.addHeader("Keep-Alive",
                "timeout=" + std::to_string(static_cast<int>(g_options.idle_timeout_sec)) + ", max=10000");
        }

        g_chain.handle(request, &response);
        LOG_INFO << conn->getPeerAddrStr() << " " << request.getMethodString() << " "
                 << request.getTarget() << " " << static_cast<int>(response.getStatusCode());

        Buffer response_buf;
        response.appendToBuffer(&response_buf);
        conn->send(&response_buf);
        request.reset();

        if(keep_alive){
            conn->touchIdleTimer();
        }else{
            conn->shutdown();
            return;
        }
    }
}

void setupLogging(){
    Logger::setLogLevel(Logger::parseLevel(g_options.log_level, Logger::INFO));
    if(g_options.log_basename.empty()){
        return; // 默认输出到stdout
    }
    g_async_log = std::make_unique<AsyncLogging>(g_options.log_basename, g_options.log_roll_size,
                                                 g_options.log_flush_interval_sec);
    g_async_log->start();
    Logger::setOutput(asyncOutput);
}

void setupStaticRoots(){
    for(const auto& root : g_options.static_roots){
        std::error_code ec;
        if(!std::filesystem::is_directory(root, ec)){
            LOG_WARN << "Static root '" << root << "' is not a directory, every request to it will pass through";
        }
        auto handler = std::make_shared<StaticFilesHandler>(root);
        LOG_INFO << "Serving static files from " << std::filesystem::absolute(handler->rootPath(), ec);
        g_chain.use(handler);
    }
    if(g_chain.size() == 0){
        LOG_WARN << "No static roots configured, every request will get 404";
    }
}

} // namespace

int main(int argc, char* argv[]){
    std::string config_file = "server.ini";
    if(argc > 1){
        config_file = argv[1];
    }

    Config config;
    if(!config.load(config_file)){
        fprintf(stderr, "ERROR: Failed to load config file: %s\n", config_file.c_str());
        return 1;
    }

    try{
        g_options = ServerOptions::fromConfig(config);
        setupLogging();
    }catch(const std::exception& e){
        fprintf(stderr, "ERROR: %s\n", e.what());
        return 1;
    }

    // 对端关闭后继续写会收到SIGPIPE
    ::signal(SIGPIPE, SIG_IGN);

    try{
        setupStaticRoots();

        EventLoop loop;

        Server http_server(&loop, g_options.http_port, "http", g_options.idle_timeout_sec, g_options.threads);
        http_server.setMessageCallback(onMessage);
        http_server.start();

        std::unique_ptr<Server> https_server;
        if(g_options.enable_ssl){
            https_server = std::make_unique<Server>(&loop, g_options.https_port, "https",
                                                    g_options.idle_timeout_sec, g_options.threads);
            https_server->enableSsl(g_options.cert_path, g_options.key_path);
            https_server->setMessageCallback(onMessage);
            https_server->start();
        }

        loop.loop();
    }catch(const std::exception& e){
        LOG_ERROR << "Fatal: " << e.what();
        if(g_async_log){
            g_async_log->stop();
        }
        return 1;
    }

    if(g_async_log){
        g_async_log->stop();
    }
    return 0;
}
