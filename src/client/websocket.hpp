#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "constants.hpp"
#include "shutdownSignal.hpp"
#include "transport.hpp"
#include "wsUrl.hpp"

// WebSocket client on Boost.Beast. Every call runs the transport's own
// io_context on the calling thread until the operation finishes or shutdown
// is requested.
struct WebSocketTransport : public Transport {
private:
  using Stream =
      boost::beast::websocket::stream<boost::beast::tcp_stream>;

  ShutdownSignal &shutdown;
  std::chrono::milliseconds idle_timeout;

  boost::asio::io_context io;
  boost::asio::ip::tcp::resolver resolver;
  // dup of the shutdown eventfd, readable once shutdown was triggered
  boost::asio::posix::stream_descriptor cancel_watch;
  std::unique_ptr<Stream> ws;
  boost::beast::flat_buffer buffer;

  ConnError run_until(const bool &done, bool watch_shutdown);
  ConnError connect_to(const WsUrl &url);
  ConnError upgrade(const WsUrl &url);
  void drop_socket();

public:
  // The server is pinged after half of idle_timeout without traffic and the
  // connection is dropped after the full period
  explicit WebSocketTransport(
      ShutdownSignal &shutdown,
      std::chrono::milliseconds idle_timeout =
          std::chrono::milliseconds(Constants::IDLE_TIMEOUT_MILISECONDS));
  ~WebSocketTransport() override;

  ConnError open(const std::string &url) override;
  ConnError send_text(const std::string &text) override;
  ConnError receive(std::string &message) override;
  void close() override;
  bool is_open() const override { return ws != nullptr; }
};
