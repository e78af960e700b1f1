#pragma once
#include <stdexcept>
#include <string>

// Fatal, raised before the connection is attempted
struct InvalidConfig : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Fatal, the output device or a clip couldn't be opened at startup
struct AudioInitError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Recoverable connection failures. Returned, never thrown.
enum class ConnError {
  Ok = 0,
  InvalidUrl,
  Resolve,
  Connect,
  Handshake,
  Closed,
  Io,
  Protocol,
  Cancelled,
};

const std::string conn_error_to_string(ConnError error);
