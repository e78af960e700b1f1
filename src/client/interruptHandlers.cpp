#include "interruptHandlers.hpp"

#include <csignal>
#include <raylib.h>
#include <signal.h>

// Only touched by the signal handler below
static ShutdownSignal *shutdown_signal = nullptr;

static void handle_interrupt(int) {
  if (shutdown_signal != nullptr) {
    shutdown_signal->trigger();
  }
}

InterruptHandlers::InterruptHandlers(ShutdownSignal &shutdown) {
  shutdown_signal = &shutdown;

  struct sigaction sa{};
  sa.sa_handler = handle_interrupt;
  sigemptyset(&sa.sa_mask);
  if (sigaction(SIGINT, &sa, nullptr) != 0 ||
      sigaction(SIGTERM, &sa, nullptr) != 0) {
    TraceLog(LOG_WARNING, "RUN: Couldn't install the interrupt handler");
  }
  signal(SIGPIPE, SIG_IGN);
}

InterruptHandlers::~InterruptHandlers() {
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  shutdown_signal = nullptr;
}
