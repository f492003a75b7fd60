// server.cpp
#include "server.hpp"
#include "session.hpp"
#include "logger.hpp"

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

Server::Server(asio::io_context& ioc, const tcp::endpoint& endpoint, const ActivityApi& api,
               std::chrono::seconds request_timeout)
    : ioc_(ioc),
      acceptor_(asio::make_strand(ioc), endpoint),
      api_(api),
      request_timeout_(request_timeout),
      port_(acceptor_.local_endpoint().port()) {
    Logger::instance().info("Server constructed", { {"address", endpoint.address().to_string()}, {"port", port_} });
}

void Server::run_accept() {
    acceptor_.async_accept(asio::make_strand(ioc_), [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
            Logger::instance().info("Acceptor stopped");
            return;
        }
        if (!ec) {
            std::make_shared<Session>(std::move(socket), *this)->start();
        } else {
            Logger::instance().error("Accept error", { {"what", ec.message()}, {"value", ec.value()} });
        }
        run_accept();
    });
}

void Server::stop() {
    asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            Logger::instance().warn("Acceptor close error", { {"what", ec.message()} });
        } else {
            Logger::instance().info("Acceptor closed");
        }
        ioc_.stop();
    });
}
