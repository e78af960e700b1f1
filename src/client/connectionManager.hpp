#pragma once
#include <chrono>
#include <functional>
#include <string>

#include "backoff.hpp"
#include "errors.hpp"
#include "shutdownSignal.hpp"
#include "transport.hpp"

enum class ConnectionState {
  Disconnected,
  Connecting,
  Connected,
  Backoff,
};

const std::string connection_state_to_string(ConnectionState state);

// Keeps one session to the event server alive. Every (re)connect sends the
// username as the handshake. Failures move the state to Backoff and are
// retried forever; only shutdown ends the cycle.
//
// Not thread safe, owned by the runner loop.
struct ConnectionManager {
private:
  Transport &transport;
  ShutdownSignal &shutdown;
  Backoff backoff;

  ConnectionState _state = ConnectionState::Disconnected;
  std::chrono::milliseconds _backoff_delay{0};

  std::string url;
  std::string username;

  void set_state(ConnectionState state,
                 std::chrono::milliseconds delay = std::chrono::milliseconds(0));
  ConnError open_session();
  void drop(ConnError reason);

public:
  // Called on every state transition, delay is only set for Backoff
  std::function<void(ConnectionState, std::chrono::milliseconds)>
      on_state_change;

  ConnectionManager(Transport &transport, ShutdownSignal &shutdown,
                    const BackoffPolicy &policy);
  ConnectionManager(Transport &transport, ShutdownSignal &shutdown,
                    const BackoffPolicy &policy, uint32_t seed);
  ~ConnectionManager();

  // Throws InvalidConfig on an empty username, nothing is sent in that case
  ConnError connect(const std::string &url, const std::string &username);

  // Waits for the next message. Reconnects first (after the backoff delay)
  // when the session is down. Each failed attempt is returned so the caller
  // can report it; calling again continues the retry cycle.
  ConnError next_event(std::string &frame);

  void close();

  ConnectionState state() const { return _state; }
  std::chrono::milliseconds backoff_delay() const { return _backoff_delay; }
};
