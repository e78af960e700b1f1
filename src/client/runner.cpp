#include "runner.hpp"

#include <raylib.h>

#include "errors.hpp"
#include "gameEvent.hpp"
#include "messageParser.hpp"

const std::string runner_state_to_string(RunnerState state) {
  switch (state) {
  case RunnerState::Starting:
    return "Starting";
  case RunnerState::Running:
    return "Running";
  case RunnerState::ShuttingDown:
    return "ShuttingDown";
  case RunnerState::Stopped:
    return "Stopped";
  default:
    return "Unknown";
  }
}

Runner::Runner(const Config &config, Transport &transport,
               AudioDevice &device, ShutdownSignal &shutdown)
    : config(config), shutdown(shutdown), audio(device),
      connection(transport, shutdown, config.backoff),
      dispatcher(audio, config) {}

void Runner::set_state(RunnerState state) {
  _state = state;
  TraceLog(LOG_DEBUG, "RUN: %s", runner_state_to_string(state).c_str());
}

int Runner::run() {
  set_state(RunnerState::Starting);
  if (!start()) {
    set_state(RunnerState::Stopped);
    return 1;
  }

  set_state(RunnerState::Running);
  loop();

  set_state(RunnerState::ShuttingDown);
  stop();

  set_state(RunnerState::Stopped);
  TraceLog(LOG_INFO, "RUN: Stopped");
  return 0;
}

bool Runner::start() {
  try {
    validate_config(config);
  } catch (const InvalidConfig &ex) {
    TraceLog(LOG_ERROR, "CONFIG: Invalid configuration: %s", ex.what());
    return false;
  }

  try {
    audio.open({config.death_clip});
  } catch (const AudioInitError &ex) {
    TraceLog(LOG_ERROR, "AUDIO: %s", ex.what());
    return false;
  }
  return true;
}

void Runner::loop() {
  ConnError status = connection.connect(config.server_url, config.username);
  if (status != ConnError::Ok && status != ConnError::Cancelled) {
    TraceLog(LOG_WARNING, "NET: Failed to connect to server %s (%s)",
             config.server_url.c_str(), conn_error_to_string(status).c_str());
  }

  std::string frame;
  while (!shutdown.triggered()) {
    status = connection.next_event(frame);
    if (status == ConnError::Ok) {
      dispatcher.dispatch(parse_message(frame));
    } else if (status == ConnError::Cancelled) {
      break;
    } else {
      TraceLog(LOG_WARNING, "NET: Connection status: %s",
               conn_error_to_string(status).c_str());
    }
  }
  TraceLog(LOG_INFO, "RUN: Received interrupt, exiting");
}

void Runner::stop() {
  connection.close();
  audio.drain();
}
