// static_files.cpp
#include "static_files.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
namespace http = boost::beast::http;

std::string mime_type_for(const fs::path& path) {
    std::string ext = path.extension().string();
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".css") return "text/css; charset=utf-8";
    if (ext == ".js") return "text/javascript; charset=utf-8";
    if (ext == ".json") return "application/json";
    if (ext == ".txt") return "text/plain; charset=utf-8";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".ico") return "image/vnd.microsoft.icon";
    return "application/octet-stream";
}

StaticFiles::StaticFiles(fs::path root) : root_(std::move(root)) {}

std::optional<fs::path> StaticFiles::resolve(const std::vector<std::string>& segments) const {
    if (segments.empty()) return std::nullopt;
    fs::path p = root_;
    for (const auto& seg : segments) {
        if (seg == "." || seg == ".." || seg.find('/') != std::string::npos
            || seg.find('\\') != std::string::npos || seg.find('\0') != std::string::npos) {
            return std::nullopt;
        }
        p /= seg;
    }
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return std::nullopt;
    return p;
}

HttpResponse StaticFiles::serve(const HttpRequest& req, const std::vector<std::string>& segments) const {
    auto path = resolve(segments);
    if (!path) {
        return make_error_response(req, http::status::not_found, "Not Found");
    }
    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        Logger::instance().warn("Static file unreadable", { {"path", path->string()} });
        return make_error_response(req, http::status::not_found, "Not Found");
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::server, kServerHeader);
    res.set(http::field::content_type, mime_type_for(*path));
    res.keep_alive(req.keep_alive());
    std::string body = contents.str();
    res.content_length(body.size());
    if (req.method() != http::verb::head) res.body() = std::move(body);
    return res;
}
