#include "websocket.hpp"

#include <unistd.h>

#include <cerrno>
#include <raylib.h>
#include <system_error>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;
using boost::system::error_code;

namespace {

ConnError classify(const error_code &ec) {
  if (ec == websocket::error::closed || ec == asio::error::eof ||
      ec == asio::error::connection_reset) {
    return ConnError::Closed;
  }
  if (ec == websocket::error::message_too_big ||
      ec == websocket::condition::protocol_violation) {
    return ConnError::Protocol;
  }
  return ConnError::Io;
}

} // namespace

WebSocketTransport::WebSocketTransport(ShutdownSignal &shutdown,
                                       std::chrono::milliseconds idle_timeout)
    : shutdown(shutdown), idle_timeout(idle_timeout), resolver(io),
      cancel_watch(io) {
  int fd = ::dup(shutdown.get_event_fd());
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(),
                            "couldn't watch the shutdown signal");
  }
  cancel_watch.assign(fd);
}

WebSocketTransport::~WebSocketTransport() { close(); }

// Runs io until done is set. With watch_shutdown a shutdown request cancels
// the pending socket operations and Cancelled is returned, their handlers
// still run before that.
ConnError WebSocketTransport::run_until(const bool &done, bool watch_shutdown) {
  bool cancelled = false;
  bool watching = watch_shutdown;
  if (watch_shutdown) {
    cancel_watch.async_wait(
        asio::posix::stream_descriptor::wait_read,
        [this, &cancelled, &watching](const error_code &ec) {
          watching = false;
          if (ec) {
            return;
          }
          cancelled = true;
          resolver.cancel();
          if (ws) {
            beast::get_lowest_layer(*ws).cancel();
          }
        });
  }

  io.restart();
  while (!done) {
    io.run_one();
  }
  if (watching) {
    cancel_watch.cancel();
    while (watching) {
      io.run_one();
    }
  }
  if (cancelled || (watch_shutdown && shutdown.triggered())) {
    return ConnError::Cancelled;
  }
  return ConnError::Ok;
}

ConnError WebSocketTransport::open(const std::string &url) {
  if (is_open()) {
    TraceLog(LOG_WARNING, "WS: open() called while connected, closing first");
    close();
  }

  WsUrl parsed;
  if (!parse_ws_url(url, parsed)) {
    TraceLog(LOG_ERROR, "WS: Invalid server url %s", url.c_str());
    return ConnError::InvalidUrl;
  }

  ConnError status = connect_to(parsed);
  if (status == ConnError::Ok) {
    status = upgrade(parsed);
  }
  if (status != ConnError::Ok) {
    // nothing was upgraded, so no close frame
    drop_socket();
    return status;
  }

  TraceLog(LOG_DEBUG, "WS: Connected to %s", url.c_str());
  return ConnError::Ok;
}

// Connect to host and port from the url, giving up after
// CONNECTION_TIMEOUT_MILISECONDS
ConnError WebSocketTransport::connect_to(const WsUrl &url) {
  bool done = false;
  error_code ec;
  tcp::resolver::results_type endpoints;
  resolver.async_resolve(
      url.host, url.port,
      [&](const error_code &resolve_ec, tcp::resolver::results_type results) {
        ec = resolve_ec;
        endpoints = results;
        done = true;
      });
  if (run_until(done, true) == ConnError::Cancelled) {
    return ConnError::Cancelled;
  }
  if (ec) {
    TraceLog(LOG_WARNING, "NET: Couldn't resolve hostname (%s) or service (%s)",
             url.host.c_str(), url.port.c_str());
    return ConnError::Resolve;
  }

  ws = std::make_unique<Stream>(io);
  beast::tcp_stream &stream = beast::get_lowest_layer(*ws);
  stream.expires_after(
      std::chrono::milliseconds(Constants::CONNECTION_TIMEOUT_MILISECONDS));
  done = false;
  stream.async_connect(endpoints,
                       [&](const error_code &connect_ec, const tcp::endpoint &) {
                         ec = connect_ec;
                         done = true;
                       });
  if (run_until(done, true) == ConnError::Cancelled) {
    return ConnError::Cancelled;
  }
  if (ec) {
    TraceLog(LOG_WARNING, "NET: Couldn't connect to %s:%s (%s)",
             url.host.c_str(), url.port.c_str(), ec.message().c_str());
    return ConnError::Connect;
  }

  // the websocket layer keeps its own timers from here on
  stream.expires_never();
  return ConnError::Ok;
}

// Beast checks the 101 status, the Upgrade and Connection headers and
// Sec-WebSocket-Accept against the key it sent
ConnError WebSocketTransport::upgrade(const WsUrl &url) {
  websocket::stream_base::timeout timeouts{};
  timeouts.handshake_timeout =
      std::chrono::milliseconds(Constants::CONNECTION_TIMEOUT_MILISECONDS);
  timeouts.idle_timeout = idle_timeout;
  timeouts.keep_alive_pings = true;
  ws->set_option(timeouts);
  ws->set_option(websocket::stream_base::decorator(
      [](websocket::request_type &request) {
        request.set(beast::http::field::user_agent, Constants::programName);
      }));
  ws->read_message_max(Constants::MESSAGE_MAX_SIZE);
  ws->text(true);

  std::string host = url.host.find(':') != std::string::npos
                         ? "[" + url.host + "]"
                         : url.host;
  if (url.port != "80") {
    host += ":" + url.port;
  }

  bool done = false;
  error_code ec;
  websocket::response_type response;
  ws->async_handshake(response, host, url.path,
                      [&](const error_code &handshake_ec) {
                        ec = handshake_ec;
                        done = true;
                      });
  if (run_until(done, true) == ConnError::Cancelled) {
    return ConnError::Cancelled;
  }
  if (ec) {
    TraceLog(LOG_WARNING, "WS: Server refused upgrade (%s), status %u",
             ec.message().c_str(), response.result_int());
    return ConnError::Handshake;
  }
  return ConnError::Ok;
}

ConnError WebSocketTransport::send_text(const std::string &text) {
  if (!is_open()) {
    return ConnError::Closed;
  }

  bool done = false;
  error_code ec;
  ws->async_write(asio::buffer(text),
                  [&](const error_code &write_ec, std::size_t) {
                    ec = write_ec;
                    done = true;
                  });
  if (run_until(done, true) == ConnError::Cancelled) {
    return ConnError::Cancelled;
  }
  if (ec) {
    TraceLog(LOG_WARNING, "WS: Cannot send text frame (%s)",
             ec.message().c_str());
    return classify(ec);
  }
  return ConnError::Ok;
}

// Pings are answered and fragments joined by beast while the read is pending
ConnError WebSocketTransport::receive(std::string &message) {
  if (!is_open()) {
    return ConnError::Closed;
  }

  bool done = false;
  error_code ec;
  buffer.clear();
  ws->async_read(buffer, [&](const error_code &read_ec, std::size_t) {
    ec = read_ec;
    done = true;
  });
  if (run_until(done, true) == ConnError::Cancelled) {
    return ConnError::Cancelled;
  }

  if (ec == websocket::error::closed) {
    TraceLog(LOG_INFO, "WS: Server closed the connection");
    return ConnError::Closed;
  }
  if (ec == beast::error::timeout) {
    TraceLog(LOG_WARNING, "WS: No traffic for %lld ms, dropping connection",
             (long long)idle_timeout.count());
    return ConnError::Io;
  }
  if (ec) {
    TraceLog(LOG_WARNING, "WS: Read failed (%s)", ec.message().c_str());
    return classify(ec);
  }

  message = beast::buffers_to_string(buffer.data());
  buffer.consume(buffer.size());
  return ConnError::Ok;
}

void WebSocketTransport::close() {
  if (!ws) {
    return;
  }
  if (ws->is_open()) {
    websocket::stream_base::timeout timeouts{};
    timeouts.handshake_timeout =
        std::chrono::milliseconds(Constants::CLOSE_TIMEOUT_MILISECONDS);
    timeouts.idle_timeout = websocket::stream_base::none();
    timeouts.keep_alive_pings = false;
    ws->set_option(timeouts);

    // runs even after shutdown so the server sees a normal closure
    bool done = false;
    error_code ec;
    ws->async_close(websocket::close_code::normal,
                    [&](const error_code &close_ec) {
                      ec = close_ec;
                      done = true;
                    });
    run_until(done, false);
    if (ec) {
      TraceLog(LOG_DEBUG, "WS: Couldn't close cleanly (%s)",
               ec.message().c_str());
    }
  }
  drop_socket();
}

void WebSocketTransport::drop_socket() {
  if (!ws) {
    return;
  }
  tcp::socket &socket = beast::get_lowest_layer(*ws).socket();
  if (socket.is_open()) {
    error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    if (ec) {
      TraceLog(LOG_DEBUG, "NET: Couldn't shutdown the connection properly");
    }
    socket.close(ec);
    if (ec) {
      TraceLog(LOG_WARNING, "NET: Couldn't close the socket properly");
    }
  }
  ws.reset();
}
