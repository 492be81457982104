#include "http/static_files_handler.h"
#include "http_utils.h"
#include "utils/logger.h"
#include <system_error>

StaticFilesHandler::Resolution StaticFilesHandler::Resolution::serve(std::filesystem::path file){
    Resolution r;
    r.kind = kServe;
    r.file = std::move(file);
    return r;
}

StaticFilesHandler::Resolution StaticFilesHandler::Resolution::passThrough(){
    return Resolution();
}

StaticFilesHandler::Resolution StaticFilesHandler::Resolution::reject(HttpResponse::HttpStatusCode status, std::string reason){
    Resolution r;
    r.kind = kReject;
    r.status = status;
    r.reason = std::move(reason);
    return r;
}

StaticFilesHandler::StaticFilesHandler(std::filesystem::path root_path)
    : root_path_(std::move(root_path)) {}

void StaticFilesHandler::invoke(const HttpRequest& req, ResponsePipeline* pipeline) const {
    Resolution resolution = resolve(req);
    switch(resolution.kind){
        case Resolution::kServe:
            pipeline->serveFile(resolution.file);
            break;
        case Resolution::kReject:
            pipeline->error(resolution.status, resolution.reason);
            break;
        case Resolution::kPassThrough:
            pipeline->passToNext();
            break;
    }
}

StaticFilesHandler::Resolution StaticFilesHandler::resolve(const HttpRequest& req) const {
    std::optional<std::string> candidate = extractPath(req);
    if(!candidate){
        return Resolution::passThrough();
    }

    std::string decoded;
    HttpUtils::DecodeError decode_error;
    if(!HttpUtils::percentDecode(*candidate, &decoded, &decode_error)){
        LOG_DEBUG << "Cannot decode request path '" << *candidate << "': " << decode_error.message();
        return Resolution::reject(HttpResponse::k400BadRequest, decode_error.message());
    }
    return resolveDecoded(decoded);
}

std::optional<std::string> StaticFilesHandler::extractPath(const HttpRequest& req) const {
    HttpRequest::Method method = req.getMethod();
    if(method != HttpRequest::GET && method != HttpRequest::HEAD){
        return std::nullopt;
    }
    std::optional<std::string> path = req.pathWithoutQuery();
    if(!path){
        return std::nullopt;
    }

    LOG_DEBUG << req.getMethodString() << " " << root_path_ << *path;

    if(*path == "/"){
        return std::string("index.html");
    }
    return path->substr(1);
}

StaticFilesHandler::Resolution StaticFilesHandler::resolveDecoded(const std::string& decoded_path) const {
    const std::filesystem::path relative(decoded_path);
    if(!isSafePath(relative)){
        std::string message = "The path '" + decoded_path + "' was denied access.";
        LOG_DEBUG << message;
        return Resolution::reject(HttpResponse::k400BadRequest, message);
    }

    // 文件名中的NUL会让stat只看到前半段，按探测失败处理
    if(decoded_path.find('\0') != std::string::npos){
        LOG_DEBUG << "Error getting metadata for file " << (root_path_ / relative)
                  << ": path contains a NUL byte";
        return Resolution::passThrough();
    }

    std::filesystem::path full_path = root_path_ / relative;
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(full_path, ec);

    if(status.type() == std::filesystem::file_type::not_found){
        return Resolution::passThrough();
    }
    if(ec){
        LOG_DEBUG << "Error getting metadata for file " << full_path << ": " << ec.message();
        return Resolution::passThrough();
    }
    if(status.type() == std::filesystem::file_type::regular){
        return Resolution::serve(full_path);
    }
    return Resolution::passThrough();
}

StaticFilesHandler::ComponentKind StaticFilesHandler::classifyComponent(const std::filesystem::path& component){
    if(component.has_root_name()){
        return ComponentKind::kPrefix;
    }
    if(component.has_root_directory()){
        return ComponentKind::kRootDir;
    }
    const std::filesystem::path::string_type& name = component.native();
    // 末尾分隔符产生的空元素，等同于"."
    if(name.empty() || component == "."){
        return ComponentKind::kCurDir;
    }
    if(component == ".."){
        return ComponentKind::kParentDir;
    }
    return ComponentKind::kNormal;
}

bool StaticFilesHandler::isSafePath(const std::filesystem::path& path){
    for(const std::filesystem::path& component : path){
        ComponentKind kind = classifyComponent(component);
        if(kind != ComponentKind::kCurDir && kind != ComponentKind::kNormal){
            return false;
        }
    }
    return true;
}
