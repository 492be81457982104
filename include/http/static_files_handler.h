#pragma once
#include "http/middleware.h"
#include "http_response.h"
#include <filesystem>
#include <optional>
#include <string>

// 在根目录下查找与请求路径对应的普通文件
//
//   请求路径 --提取--> 候选相对路径 --百分号解码--> UTF-8路径 --安全检查--> 根目录/路径 --stat--> 结果
//
// 结果只有三种: 找到普通文件(Serve)、不归本处理器管(PassThrough)、请求非法(Reject)
// 根目录在构造时确定，之后只读，一个实例可被所有I/O线程共享
class StaticFilesHandler : public Middleware{
public:
    // 路径分量的类别
    enum class ComponentKind{
        kCurDir,    // "."
        kParentDir, // ".."
        kNormal,    // 普通的文件名或目录名
        kRootDir,   // 根目录分隔符
        kPrefix,    // 平台相关的前缀，如Windows的盘符
    };

    struct Resolution{
        enum Kind { kServe, kPassThrough, kReject };

        Kind kind = kPassThrough;
        std::filesystem::path file;                                     // kServe
        HttpResponse::HttpStatusCode status = HttpResponse::kUnknown;   // kReject
        std::string reason;                                             // kReject

        static Resolution serve(std::filesystem::path file);
        static Resolution passThrough();
        static Resolution reject(HttpResponse::HttpStatusCode status, std::string reason);
    };

    // root_path可以是绝对路径，也可以相对于进程的工作目录
    explicit StaticFilesHandler(std::filesystem::path root_path);

    const std::filesystem::path& rootPath() const { return root_path_; }

    // 把resolve的结果映射到pipeline上，恰好调用一个答复
    void invoke(const HttpRequest& req, ResponsePipeline* pipeline) const override;

    // 完整的解析过程，不读取文件内容
    Resolution resolve(const HttpRequest& req) const;

    // 只处理GET和HEAD，且请求目标必须带有路径
    // "/"映射为"index.html"，其余去掉第一个字符
    std::optional<std::string> extractPath(const HttpRequest& req) const;

    // 安全检查后拼接到根目录并stat一次
    Resolution resolveDecoded(const std::string& decoded_path) const;

    static ComponentKind classifyComponent(const std::filesystem::path& component);

    // 每个分量都必须是"."或普通名称，出现".."、根或前缀则整体不安全
    // 不做规范化，"a/../b"这样本可化简的路径同样被拒绝；不访问文件系统
    static bool isSafePath(const std::filesystem::path& path);

private:
    const std::filesystem::path root_path_;
};
