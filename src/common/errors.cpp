#include "errors.hpp"

// Only used in logs
const std::string conn_error_to_string(ConnError error) {
  switch (error) {
  case ConnError::Ok:
    return "Ok";
  case ConnError::InvalidUrl:
    return "InvalidUrl";
  case ConnError::Resolve:
    return "Resolve";
  case ConnError::Connect:
    return "Connect";
  case ConnError::Handshake:
    return "Handshake";
  case ConnError::Closed:
    return "Closed";
  case ConnError::Io:
    return "Io";
  case ConnError::Protocol:
    return "Protocol";
  case ConnError::Cancelled:
    return "Cancelled";
  default:
    return "Unknown";
  }
}
