#pragma once

#include <boost/asio.hpp>
#include <string>

class ConnectionGateway;

// Accepts client WebSocket connections on one TCP endpoint.
class WsServer {
public:
  WsServer(boost::asio::io_context &ioc, const std::string &bindIp, int port,
           const std::string &pathPrefix, ConnectionGateway &gateway);

  bool start();
  void stop();

  // Bound port; differs from the configured one when that was 0.
  int port() const { return port_; }

private:
  void doAccept();

  boost::asio::io_context &ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::string bindIp_;
  int port_;
  std::string pathPrefix_;
  ConnectionGateway &gateway_;
};
