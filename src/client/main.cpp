#include <iostream>
#include <raylib.h>
#include <stdexcept>

#include "config.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include "interruptHandlers.hpp"
#include "raylibAudioDevice.hpp"
#include "runner.hpp"
#include "shutdownSignal.hpp"
#include "websocket.hpp"

int main(int argc, char **argv) {
  const std::string program = argc > 0 ? argv[0] : Constants::programName;

  Config config;
  try {
    if (!parse_arguments(argc, argv, config)) {
      std::cout << usage(program);
      return 0;
    }
    read_config_file(Constants::CONFIG_FILE_PATH, config);
  } catch (const InvalidConfig &ex) {
    TraceLog(LOG_ERROR, "CONFIG: %s", ex.what());
    std::cerr << usage(program);
    return 1;
  }
  SetTraceLogLevel(config.log_level);

  try {
    ShutdownSignal shutdown;
    InterruptHandlers interrupts(shutdown);

    WebSocketTransport transport(shutdown);
    RaylibAudioDevice device;
    Runner runner(config, transport, device, shutdown);
    return runner.run();
  } catch (const std::runtime_error &ex) {
    TraceLog(LOG_ERROR, "RUN: %s", ex.what());
    return 1;
  }
}
