#pragma once
#include <string>

#include "errors.hpp"

// Message channel to the event server. At most one connection is open at a
// time; open() on an open transport is a caller error.
struct Transport {
  virtual ~Transport() = default;

  virtual ConnError open(const std::string &url) = 0;
  virtual ConnError send_text(const std::string &text) = 0;
  // Blocks until a whole message arrives, the connection drops or shutdown
  // is requested
  virtual ConnError receive(std::string &message) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};
