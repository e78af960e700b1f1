#pragma once
#include <atomic>
#include <chrono>

// Cancellation token backed by an eventfd so it can be polled together with
// sockets. trigger() only touches the atomic flag and write(2), which keeps
// it safe to call from a signal handler.
struct ShutdownSignal {
private:
  int efd;
  std::atomic_bool _triggered = false;

public:
  ShutdownSignal();
  ~ShutdownSignal();
  ShutdownSignal(const ShutdownSignal &) = delete;
  ShutdownSignal &operator=(const ShutdownSignal &) = delete;

  int get_event_fd() const { return efd; }

  void trigger();
  bool triggered() const { return _triggered.load(); }

  // returns true if shutdown was requested before the timeout elapsed
  bool wait_for(std::chrono::milliseconds timeout) const;
};
