// activity_api.cpp
#include "activity_api.hpp"
#include "logger.hpp"
#include "url.hpp"
#include <exception>
#include <vector>

namespace http = boost::beast::http;
using json = nlohmann::json;

static const char* kIndexPage = "/static/index.html";

ActivityApi::ActivityApi(ActivityRegistry& registry, std::shared_ptr<const StaticFiles> static_files)
    : registry_(registry), static_files_(std::move(static_files)) {}

HttpResponse ActivityApi::handle(const HttpRequest& req) const {
    try {
        return route(req);
    } catch (const std::exception& ex) {
        Logger::instance().error("Request handler failed", { {"method", to_std_string(req.method_string())}, {"target", to_std_string(req.target())}, {"what", ex.what()} });
        return make_error_response(req, http::status::internal_server_error, "Internal Server Error");
    }
}

HttpResponse ActivityApi::route(const HttpRequest& req) const {
    const RequestTarget target = parse_target(to_std_string(req.target()));
    const auto& seg = target.segments;
    const auto method = req.method();

    if (seg.empty()) {
        if (method != http::verb::get) return method_not_allowed(req, "GET");
        return make_redirect_response(req, kIndexPage);
    }

    if (seg[0] == "activities") {
        if (seg.size() == 1) {
            if (method != http::verb::get) return method_not_allowed(req, "GET");
            return list_activities(req);
        }
        if (seg.size() == 3 && seg[2] == "signup") {
            if (method != http::verb::post) return method_not_allowed(req, "POST");
            return signup(req, seg[1], target.query);
        }
        if (seg.size() == 3 && seg[2] == "unregister") {
            if (method != http::verb::delete_) return method_not_allowed(req, "DELETE");
            return unregister(req, seg[1], target.query);
        }
    }

    if (seg[0] == "static" && static_files_) {
        if (method != http::verb::get && method != http::verb::head) return method_not_allowed(req, "GET, HEAD");
        return static_files_->serve(req, std::vector<std::string>(seg.begin() + 1, seg.end()));
    }

    return make_error_response(req, http::status::not_found, "Not Found");
}

HttpResponse ActivityApi::list_activities(const HttpRequest& req) const {
    json body = json::object();
    for (const auto& kv : registry_.list()) {
        body[kv.first] = kv.second;
    }
    return make_json_response(req, http::status::ok, body);
}

HttpResponse ActivityApi::signup(const HttpRequest& req, const std::string& activity_name,
                                 const std::map<std::string, std::string>& query) const {
    auto it = query.find("email");
    if (it == query.end()) return make_missing_query_response(req, "email");
    const std::string& email = it->second;

    RegistryStatus status = registry_.signup(activity_name, email);
    if (status != RegistryStatus::Ok) return registry_failure(req, status);
    return make_json_response(req, http::status::ok,
                              json{ {"message", email + " signed up for " + activity_name} });
}

HttpResponse ActivityApi::unregister(const HttpRequest& req, const std::string& activity_name,
                                     const std::map<std::string, std::string>& query) const {
    auto it = query.find("email");
    if (it == query.end()) return make_missing_query_response(req, "email");
    const std::string& email = it->second;

    RegistryStatus status = registry_.unregister(activity_name, email);
    if (status != RegistryStatus::Ok) return registry_failure(req, status);
    return make_json_response(req, http::status::ok,
                              json{ {"message", email + " unregistered from " + activity_name} });
}

HttpResponse ActivityApi::registry_failure(const HttpRequest& req, RegistryStatus status) const {
    switch (status) {
        case RegistryStatus::ActivityNotFound:
            return make_error_response(req, http::status::not_found, "Activity not found");
        case RegistryStatus::AlreadySignedUp:
            return make_error_response(req, http::status::bad_request, "Student already signed up for this activity");
        case RegistryStatus::NotSignedUp:
            return make_error_response(req, http::status::bad_request, "Student not signed up for this activity");
        case RegistryStatus::ActivityFull:
            return make_error_response(req, http::status::bad_request, "Activity is full");
        case RegistryStatus::Ok:
            break;
    }
    Logger::instance().error("Unexpected registry status", { {"status", to_string(status)} });
    return make_error_response(req, http::status::internal_server_error, "Internal Server Error");
}

HttpResponse ActivityApi::method_not_allowed(const HttpRequest& req, const std::string& allow) const {
    HttpResponse res = make_error_response(req, http::status::method_not_allowed, "Method Not Allowed");
    res.set(http::field::allow, allow);
    return res;
}
