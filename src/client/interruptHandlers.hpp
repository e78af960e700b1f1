#pragma once
#include "shutdownSignal.hpp"

// Routes SIGINT and SIGTERM to shutdown and ignores SIGPIPE while alive.
// The default handlers are back once it goes out of scope, however that
// happens.
struct InterruptHandlers {
  explicit InterruptHandlers(ShutdownSignal &shutdown);
  ~InterruptHandlers();

  InterruptHandlers(const InterruptHandlers &) = delete;
  InterruptHandlers &operator=(const InterruptHandlers &) = delete;
};
