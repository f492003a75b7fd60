// session.cpp
#include "session.hpp"
#include "server.hpp"
#include "logger.hpp"
#include <chrono>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

static std::string preview_text(const std::string& s, size_t maxlen = 200) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

// Errors raised by the HTTP parser, as opposed to socket errors.
static bool is_parse_error(const beast::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_target).category();
}

static std::string describe_endpoint(const asio::ip::tcp::socket& socket) {
    boost::system::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

Session::Session(asio::ip::tcp::socket socket, Server& server)
    : stream_(std::move(socket)), server_(server) {
    remote_ = describe_endpoint(stream_.socket());
    Logger::instance().debug("Connection opened", { {"remote", remote_} });
}

Session::~Session() {
    Logger::instance().debug("Connection closed", { {"remote", remote_} });
}

void Session::start() {
    // run on the connection's strand from the very first operation
    auto self = shared_from_this();
    asio::dispatch(stream_.get_executor(), [self]() { self->do_read(); });
}

void Session::do_read() {
    request_ = {};
    stream_.expires_after(server_.request_timeout());
    auto self = shared_from_this();
    http::async_read(stream_, read_buffer_, request_, [self](beast::error_code ec, std::size_t n) {
        self->on_read(ec, n);
    });
}

void Session::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec == beast::error::timeout) {
        Logger::instance().debug("Session timed out", { {"remote", remote_} });
        return;
    }
    if (ec && is_parse_error(ec) && ec != http::error::partial_message) {
        Logger::instance().warn("Malformed request", { {"ec", ec.message()}, {"remote", remote_} });
        send_response(make_bad_request_response("Invalid HTTP request"));
        return;
    }
    if (ec) {
        Logger::instance().warn("Session read error/disconnect", { {"ec", ec.message()}, {"remote", remote_} });
        return;
    }

    auto started = std::chrono::steady_clock::now();
    HttpResponse res = server_.api().handle(request_);
    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started).count();

    nlohmann::json fields = {
        {"method", to_std_string(request_.method_string())},
        {"target", preview_text(to_std_string(request_.target()))},
        {"status", res.result_int()},
        {"remote", remote_},
        {"elapsed_us", static_cast<int64_t>(elapsed_us)}
    };
    if (res.result_int() >= 500) Logger::instance().error("Request failed", fields);
    else Logger::instance().info("Request handled", fields);

    send_response(std::move(res));
}

void Session::send_response(HttpResponse res) {
    // the response must outlive the async write
    response_ = std::make_shared<HttpResponse>(std::move(res));
    stream_.expires_after(server_.request_timeout());
    auto self = shared_from_this();
    http::async_write(stream_, *response_, [self](beast::error_code ec, std::size_t) {
        bool keep_alive = self->response_->keep_alive();
        self->response_.reset();
        if (ec) {
            Logger::instance().warn("Session write error/disconnect", { {"ec", ec.message()}, {"remote", self->remote_} });
            return;
        }
        if (!keep_alive) {
            self->do_close();
            return;
        }
        self->do_read();
    });
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
        Logger::instance().debug("Session shutdown error", { {"ec", ec.message()}, {"remote", remote_} });
    }
}
