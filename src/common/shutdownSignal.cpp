#include "shutdownSignal.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <stdexcept>

using namespace std::chrono;

ShutdownSignal::ShutdownSignal() {
  efd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (efd == -1) {
    throw std::runtime_error{"Eventfd ShutdownSignal"};
  }
}

ShutdownSignal::~ShutdownSignal() { close(efd); }

void ShutdownSignal::trigger() {
  _triggered = true;
  // the counter is never drained, so the fd stays readable from now on
  const uint64_t one = 1;
  ssize_t written = write(efd, &one, sizeof(one));
  (void)written;
}

bool ShutdownSignal::wait_for(milliseconds timeout) const {
  auto deadline = steady_clock::now() + timeout;
  while (!triggered()) {
    auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
    if (left.count() <= 0) {
      return false;
    }
    pollfd pfd{efd, POLLIN, 0};
    int res = poll(&pfd, 1, (int)left.count());
    if (res == -1 && errno != EINTR) {
      return triggered();
    }
  }
  return true;
}
