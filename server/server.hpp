// server.hpp
#pragma once
#include <boost/asio.hpp>
#include <chrono>
#include "activity_api.hpp"

class Session;

class Server {
public:
    Server(boost::asio::io_context& ioc,
           const boost::asio::ip::tcp::endpoint& endpoint,
           const ActivityApi& api,
           std::chrono::seconds request_timeout = std::chrono::seconds(30));

    void run_accept();
    // Closes the acceptor on its strand, then stops the io_context. Open
    // connections are dropped.
    void stop();

    unsigned short port() const { return port_; }
    const ActivityApi& api() const { return api_; }
    std::chrono::seconds request_timeout() const { return request_timeout_; }

private:
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    const ActivityApi& api_;
    std::chrono::seconds request_timeout_;
    unsigned short port_;
};
