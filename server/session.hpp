// session.hpp
#pragma once
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "protocol.hpp"

class Server; // forward

// One HTTP/1.1 connection. Requests are handled strictly one after another;
// the connection stays open while the client asks for keep-alive.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket socket, Server& server);
    ~Session();
    void start();

private:
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
    void send_response(HttpResponse res);
    void do_close();

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer read_buffer_;
    HttpRequest request_;
    std::shared_ptr<HttpResponse> response_;
    Server& server_;
    std::string remote_;
};
