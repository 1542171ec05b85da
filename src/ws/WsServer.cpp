#include "WsServer.h"
#include "../app/Logger.h"
#include "WsConnection.h"

namespace net = boost::asio;
using tcp = net::ip::tcp;

WsServer::WsServer(net::io_context &ioc, const std::string &bindIp, int port,
                   const std::string &pathPrefix, ConnectionGateway &gateway)
    : ioc_(ioc), acceptor_(net::make_strand(ioc)), bindIp_(bindIp),
      port_(port), pathPrefix_(pathPrefix), gateway_(gateway) {}

bool WsServer::start() {
  boost::system::error_code ec;
  auto address = net::ip::make_address(bindIp_, ec);
  if (ec) {
    LOG_ERROR("Invalid bind address " << bindIp_ << ": " << ec.message());
    return false;
  }
  tcp::endpoint endpoint(address, static_cast<unsigned short>(port_));

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec)
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(endpoint, ec);
  if (!ec)
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    LOG_ERROR("Failed to listen on " << bindIp_ << ":" << port_ << ": "
                                     << ec.message());
    return false;
  }

  port_ = acceptor_.local_endpoint().port();
  LOG_INFO("WebSocket server listening on " << bindIp_ << ":" << port_
                                            << pathPrefix_ << "<session_id>");
  doAccept();
  return true;
}

void WsServer::stop() {
  net::post(acceptor_.get_executor(), [this]() {
    if (!acceptor_.is_open())
      return;
    boost::system::error_code ec;
    acceptor_.close(ec);
    LOG_INFO("WebSocket server stopped accepting connections");
  });
}

void WsServer::doAccept() {
  acceptor_.async_accept(
      net::make_strand(ioc_),
      [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
          if (ec != net::error::operation_aborted)
            LOG_WARN("Accept failed: " << ec.message());
          if (!acceptor_.is_open())
            return;
        } else {
          std::make_shared<WsConnection>(std::move(socket), pathPrefix_,
                                         gateway_)
              ->start();
        }
        doAccept();
      });
}
