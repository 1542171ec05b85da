#pragma once

#include "ClientChannel.h"
#include "Outbox.h"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <memory>
#include <string>

class ConnectionGateway;
class RelaySession;

// Server side of one client WebSocket. Reads the HTTP upgrade, hands the
// connection to the gateway and pumps frames between socket and relay. Every
// handler runs on the socket's strand.
class WsConnection : public ClientChannel,
                     public std::enable_shared_from_this<WsConnection> {
public:
  WsConnection(boost::asio::ip::tcp::socket socket,
               const std::string &pathPrefix, ConnectionGateway &gateway);
  ~WsConnection() override;

  void start();

  void sendText(const std::string &text) override;
  void close(CloseCode code, const std::string &reason) override;
  void post(std::function<void()> task) override;
  bool isOpen() const override { return open_; }
  std::string remoteAddress() const override { return remote_; }

  // Splits "<prefix><session_id>?token=..." into its parts. Returns false
  // when the path is outside the prefix or the session id is empty.
  static bool parseTarget(const std::string &target, const std::string &prefix,
                          std::string &sessionId, std::string &token);
  // Token from an "Authorization: Bearer <jwt>" value, empty otherwise.
  static std::string bearerToken(const std::string &authorization);
  static std::string urlDecode(const std::string &text);

private:
  void onRequest(boost::beast::error_code ec, std::size_t bytes);
  void rejectHttp(boost::beast::http::status status, const std::string &body);
  void onAccept(boost::beast::error_code ec, const std::string &sessionId,
                const std::string &token);
  void doRead();
  void onRead(boost::beast::error_code ec, std::size_t bytes);
  void doWrite();
  void onWrite(boost::beast::error_code ec, std::size_t bytes);
  void doClose();
  void onDisconnect(boost::beast::error_code ec);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> request_;
  std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>>
      response_;

  std::string pathPrefix_;
  ConnectionGateway &gateway_;
  std::string remote_;
  std::shared_ptr<RelaySession> relay_;

  Outbox outbox_;
  bool closeRequested_ = false;
  bool closing_ = false;
  boost::beast::websocket::close_reason closeReason_;
  std::atomic<bool> open_{false};
};
