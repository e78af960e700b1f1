#pragma once
#include <atomic>
#include <string>

#include "audioDevice.hpp"
#include "audioEngine.hpp"
#include "config.hpp"
#include "connectionManager.hpp"
#include "eventDispatcher.hpp"
#include "shutdownSignal.hpp"
#include "transport.hpp"

enum class RunnerState {
  Starting,
  Running,
  ShuttingDown,
  Stopped,
};

const std::string runner_state_to_string(RunnerState state);

// Starting -> Running -> ShuttingDown -> Stopped
//
// Starting validates the config and opens the audio device, either failing
// ends the run with exit code 1 before the network is touched. Running reads,
// decodes and dispatches events until shutdown is triggered.
struct Runner {
private:
  const Config &config;
  ShutdownSignal &shutdown;
  AudioEngine audio;
  ConnectionManager connection;
  EventDispatcher dispatcher;
  std::atomic<RunnerState> _state{RunnerState::Starting};

  void set_state(RunnerState state);
  bool start();
  void loop();
  void stop();

public:
  Runner(const Config &config, Transport &transport, AudioDevice &device,
         ShutdownSignal &shutdown);

  // returns the process exit code
  int run();

  RunnerState state() const { return _state.load(); }
};
