#pragma once
#include <string>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

constexpr const char* kServerHeader = "mergington-activities";

inline std::string to_std_string(boost::beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

// Helpers to build the responses the API sends. `req` supplies the HTTP
// version and keep-alive flag.
inline HttpResponse make_json_response(const HttpRequest& req,
                                       boost::beast::http::status status,
                                       const nlohmann::json& body) {
    HttpResponse res{status, req.version()};
    res.set(boost::beast::http::field::server, kServerHeader);
    res.set(boost::beast::http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

inline HttpResponse make_error_response(const HttpRequest& req,
                                        boost::beast::http::status status,
                                        const std::string& detail) {
    return make_json_response(req, status, nlohmann::json{ {"detail", detail} });
}

// 422 body for a required query parameter that was not supplied.
inline HttpResponse make_missing_query_response(const HttpRequest& req, const std::string& param) {
    nlohmann::json item = {
        {"type", "missing"},
        {"loc", nlohmann::json::array({"query", param})},
        {"msg", "Field required"},
        {"input", nullptr}
    };
    return make_json_response(req, boost::beast::http::status::unprocessable_entity,
                              nlohmann::json{ {"detail", nlohmann::json::array({item})} });
}

// 400 for a request that could not be parsed; there is no request to take the
// version or keep-alive flag from, so the connection is closed after it.
inline HttpResponse make_bad_request_response(const std::string& detail) {
    HttpResponse res{boost::beast::http::status::bad_request, 11};
    res.set(boost::beast::http::field::server, kServerHeader);
    res.set(boost::beast::http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = nlohmann::json{ {"detail", detail} }.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

inline HttpResponse make_redirect_response(const HttpRequest& req, const std::string& location) {
    HttpResponse res{boost::beast::http::status::temporary_redirect, req.version()};
    res.set(boost::beast::http::field::server, kServerHeader);
    res.set(boost::beast::http::field::location, location);
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}
