#include "connectionManager.hpp"

#include <raylib.h>

using namespace std::chrono;

const std::string connection_state_to_string(ConnectionState state) {
  switch (state) {
  case ConnectionState::Disconnected:
    return "Disconnected";
  case ConnectionState::Connecting:
    return "Connecting";
  case ConnectionState::Connected:
    return "Connected";
  case ConnectionState::Backoff:
    return "Backoff";
  default:
    return "Unknown";
  }
}

ConnectionManager::ConnectionManager(Transport &transport,
                                     ShutdownSignal &shutdown,
                                     const BackoffPolicy &policy)
    : transport(transport), shutdown(shutdown), backoff(policy) {}

ConnectionManager::ConnectionManager(Transport &transport,
                                     ShutdownSignal &shutdown,
                                     const BackoffPolicy &policy,
                                     uint32_t seed)
    : transport(transport), shutdown(shutdown), backoff(policy, seed) {}

ConnectionManager::~ConnectionManager() {
  if (transport.is_open()) {
    transport.close();
  }
}

void ConnectionManager::set_state(ConnectionState state, milliseconds delay) {
  _state = state;
  _backoff_delay = delay;
  TraceLog(LOG_DEBUG, "NET: Connection state %s",
           connection_state_to_string(state).c_str());
  if (on_state_change) {
    on_state_change(state, delay);
  }
}

ConnError ConnectionManager::connect(const std::string &url,
                                     const std::string &username) {
  if (username.empty()) {
    throw InvalidConfig{"username must not be empty"};
  }
  this->url = url;
  this->username = username;
  backoff.reset();
  return open_session();
}

ConnError ConnectionManager::open_session() {
  if (transport.is_open()) {
    transport.close();
  }
  set_state(ConnectionState::Connecting);

  ConnError status = transport.open(url);
  if (status != ConnError::Ok) {
    drop(status);
    return status;
  }

  status = transport.send_text(username);
  if (status != ConnError::Ok) {
    TraceLog(LOG_WARNING, "NET: Couldn't send username to %s", url.c_str());
    drop(status);
    return status;
  }

  backoff.reset();
  set_state(ConnectionState::Connected);
  TraceLog(LOG_INFO, "NET: Connected to server %s with username %s",
           url.c_str(), username.c_str());
  return ConnError::Ok;
}

void ConnectionManager::drop(ConnError reason) {
  transport.close();
  if (reason == ConnError::Cancelled) {
    set_state(ConnectionState::Disconnected);
    return;
  }
  set_state(ConnectionState::Backoff, backoff.next_delay());
}

ConnError ConnectionManager::next_event(std::string &frame) {
  if (username.empty()) {
    TraceLog(LOG_ERROR, "NET: next_event() called before connect()");
    return ConnError::Closed;
  }

  while (_state != ConnectionState::Connected) {
    if (shutdown.triggered()) {
      return ConnError::Cancelled;
    }
    if (_state == ConnectionState::Backoff) {
      milliseconds wait = backoff.jitter(_backoff_delay);
      TraceLog(LOG_INFO, "NET: Reconnecting to %s in %lld ms (attempt %u)",
               url.c_str(), (long long)wait.count(), backoff.attempts());
      if (shutdown.wait_for(wait)) {
        return ConnError::Cancelled;
      }
    }

    ConnError status = open_session();
    if (status != ConnError::Ok) {
      return status;
    }
  }

  if (shutdown.triggered()) {
    return ConnError::Cancelled;
  }

  ConnError status = transport.receive(frame);
  if (status == ConnError::Ok) {
    TraceLog(LOG_DEBUG, "NET: Received message %s", frame.c_str());
    return status;
  }

  if (status != ConnError::Cancelled) {
    TraceLog(LOG_WARNING, "NET: Lost connection to server (%s)",
             conn_error_to_string(status).c_str());
  }
  drop(status);
  return status;
}

void ConnectionManager::close() {
  if (transport.is_open()) {
    transport.close();
  }
  if (_state != ConnectionState::Disconnected) {
    set_state(ConnectionState::Disconnected);
  }
}
