#include "WsConnection.h"
#include "../app/Logger.h"
#include "../gateway/ConnectionGateway.h"
#include "../relay/RelaySession.h"
#include <cctype>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

WsConnection::WsConnection(tcp::socket socket, const std::string &pathPrefix,
                           ConnectionGateway &gateway)
    : ws_(std::move(socket)), pathPrefix_(pathPrefix), gateway_(gateway) {
  beast::error_code ec;
  auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
  if (!ec)
    remote_ = endpoint.address().to_string() + ":" +
              std::to_string(endpoint.port());
  else
    remote_ = "unknown";
}

WsConnection::~WsConnection() {
  LOG_DEBUG("Connection from " << remote_ << " released");
}

void WsConnection::start() {
  net::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
    beast::get_lowest_layer(self->ws_).expires_after(std::chrono::seconds(30));
    http::async_read(beast::get_lowest_layer(self->ws_), self->buffer_,
                     self->request_,
                     beast::bind_front_handler(&WsConnection::onRequest, self));
  });
}

std::string WsConnection::urlDecode(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out += ' ';
    } else if (c == '%' && i + 2 < text.size() &&
               std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
      i += 2;
    } else {
      out += c;
    }
  }
  return out;
}

bool WsConnection::parseTarget(const std::string &target,
                               const std::string &prefix,
                               std::string &sessionId, std::string &token) {
  std::string path = target;
  std::string query;
  auto q = target.find('?');
  if (q != std::string::npos) {
    path = target.substr(0, q);
    query = target.substr(q + 1);
  }

  if (path.compare(0, prefix.size(), prefix) != 0)
    return false;
  sessionId = urlDecode(path.substr(prefix.size()));
  if (sessionId.empty() || sessionId.find('/') != std::string::npos)
    return false;

  token.clear();
  size_t pos = 0;
  while (pos <= query.size() && !query.empty()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos
                                             ? std::string::npos
                                             : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && pair.substr(0, eq) == "token")
      token = urlDecode(pair.substr(eq + 1));
    if (amp == std::string::npos)
      break;
    pos = amp + 1;
  }
  return true;
}

std::string WsConnection::bearerToken(const std::string &authorization) {
  static const std::string scheme = "bearer ";
  if (authorization.size() <= scheme.size())
    return "";
  for (size_t i = 0; i < scheme.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(authorization[i])) != scheme[i])
      return "";
  }
  std::string token = authorization.substr(scheme.size());
  while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())))
    token.pop_back();
  return token;
}

void WsConnection::onRequest(beast::error_code ec, std::size_t) {
  if (ec) {
    LOG_DEBUG("Upgrade request from " << remote_ << " failed: " << ec.message());
    return;
  }

  if (!websocket::is_upgrade(request_)) {
    rejectHttp(http::status::upgrade_required, "WebSocket upgrade required\n");
    return;
  }

  std::string sessionId, token;
  std::string target(request_.target());
  if (!parseTarget(target, pathPrefix_, sessionId, token)) {
    LOG_WARN("Rejecting upgrade from " << remote_ << " for unknown path "
                                       << target.substr(0, target.find('?')));
    rejectHttp(http::status::not_found, "Not found\n");
    return;
  }
  if (token.empty()) {
    auto auth = request_.find(http::field::authorization);
    if (auth != request_.end())
      token = bearerToken(std::string(auth->value()));
  }

  beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.set_option(websocket::stream_base::decorator(
      [](websocket::response_type &res) {
        res.set(http::field::server, "scribe-relay");
      }));

  ws_.async_accept(request_, [self = shared_from_this(), sessionId,
                              token](beast::error_code ec) {
    self->onAccept(ec, sessionId, token);
  });
}

void WsConnection::rejectHttp(http::status status, const std::string &body) {
  response_ = std::make_shared<http::response<http::string_body>>(
      status, request_.version());
  response_->set(http::field::server, "scribe-relay");
  response_->set(http::field::content_type, "text/plain");
  response_->keep_alive(false);
  response_->body() = body;
  response_->prepare_payload();

  http::async_write(beast::get_lowest_layer(ws_), *response_,
                    [self = shared_from_this()](beast::error_code ec,
                                                std::size_t) {
                      beast::error_code ignored;
                      beast::get_lowest_layer(self->ws_).socket().shutdown(
                          tcp::socket::shutdown_send, ignored);
                      if (ec) {
                        LOG_DEBUG("HTTP rejection to " << self->remote_
                                                       << " failed: "
                                                       << ec.message());
                      }
                    });
}

void WsConnection::onAccept(beast::error_code ec, const std::string &sessionId,
                            const std::string &token) {
  if (ec) {
    LOG_WARN("WebSocket handshake with " << remote_
                                         << " failed: " << ec.message());
    return;
  }
  open_ = true;
  buffer_.consume(buffer_.size());
  doRead();

  try {
    relay_ = gateway_.admit(shared_from_this(), token, sessionId);
  } catch (const std::exception &e) {
    LOG_ERROR("[" << sessionId << "] admission failed: " << e.what());
    close(CloseCode::INTERNAL_ERROR, "internal error");
  }
}

void WsConnection::doRead() {
  ws_.async_read(buffer_,
                 beast::bind_front_handler(&WsConnection::onRead,
                                           shared_from_this()));
}

void WsConnection::onRead(beast::error_code ec, std::size_t) {
  if (ec) {
    onDisconnect(ec);
    return;
  }

  if (relay_) {
    std::string payload = beast::buffers_to_string(buffer_.data());
    if (ws_.got_text())
      relay_->onText(payload);
    else
      relay_->onBinary(std::move(payload));
  }
  buffer_.consume(buffer_.size());
  doRead();
}

void WsConnection::onDisconnect(beast::error_code ec) {
  bool wasOpen = open_.exchange(false);
  if (ec == websocket::error::closed) {
    LOG_DEBUG("Connection from " << remote_ << " closed");
  } else if (ec != net::error::operation_aborted) {
    LOG_INFO("Connection from " << remote_ << " lost: " << ec.message());
  }

  outbox_.dropPending();
  if (relay_) {
    if (wasOpen && !closeRequested_)
      relay_->onDisconnect();
    relay_.reset();
  }
}

void WsConnection::post(std::function<void()> task) {
  net::post(ws_.get_executor(), std::move(task));
}

void WsConnection::sendText(const std::string &text) {
  post([self = shared_from_this(), text]() {
    if (!self->open_ || self->closeRequested_)
      return;
    if (self->outbox_.push(text))
      self->doWrite();
  });
}

void WsConnection::close(CloseCode code, const std::string &reason) {
  post([self = shared_from_this(), code, reason]() {
    if (!self->open_ || self->closeRequested_)
      return;
    self->closeRequested_ = true;
    self->closeReason_ = websocket::close_reason(
        static_cast<websocket::close_code>(code), reason);
    if (!self->outbox_.writing())
      self->doClose();
  });
}

void WsConnection::doWrite() {
  ws_.text(true);
  ws_.async_write(net::buffer(outbox_.front()),
                  beast::bind_front_handler(&WsConnection::onWrite,
                                            shared_from_this()));
}

void WsConnection::onWrite(beast::error_code ec, std::size_t) {
  if (ec) {
    LOG_DEBUG("Write to " << remote_ << " failed: " << ec.message());
    outbox_.dropPending();
    outbox_.writeDone();
    return;
  }
  if (outbox_.writeDone())
    doWrite();
  else if (closeRequested_)
    doClose();
}

void WsConnection::doClose() {
  if (closing_)
    return;
  closing_ = true;
  LOG_DEBUG("Closing connection from " << remote_ << " with code "
                                       << closeReason_.code);
  ws_.async_close(closeReason_, [self = shared_from_this()](
                                    beast::error_code ec) {
    if (ec && ec != websocket::error::closed) {
      LOG_DEBUG("Close handshake with " << self->remote_
                                        << " failed: " << ec.message());
    }
  });
}
