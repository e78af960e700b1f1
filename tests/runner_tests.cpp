#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <chrono>
#include <csignal>
#include <future>
#include <signal.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/client/interruptHandlers.hpp"
#include "../src/client/runner.hpp"
#include "../src/common/config.hpp"
#include "../src/common/shutdownSignal.hpp"
#include "fakes.hpp"

using namespace std::chrono;

namespace {

Config alice_config() {
  Config config;
  config.username = "alice";
  config.volume = 0.8f;
  config.backoff.initial = milliseconds(1);
  config.backoff.max = milliseconds(4);
  config.backoff.jitter_ratio = 0.0;
  return config;
}

} // namespace

TEST_CASE("Audio device unavailable exits before any network attempt",
          "[runner]") {
  Config config = alice_config();
  FakeTransport transport;
  FakeAudioDevice device;
  device.init_ok = false;
  ShutdownSignal shutdown;

  Runner runner(config, transport, device, shutdown);
  CHECK(runner.run() != 0);
  CHECK(runner.state() == RunnerState::Stopped);
  CHECK(transport.opens() == 0);
}

TEST_CASE("Invalid config exits before opening anything", "[runner]") {
  Config config = alice_config();
  config.username = "";
  FakeTransport transport;
  FakeAudioDevice device;
  ShutdownSignal shutdown;

  Runner runner(config, transport, device, shutdown);
  CHECK(runner.run() != 0);
  CHECK_FALSE(device.initialized());
  CHECK(transport.opens() == 0);
}

TEST_CASE("A death frame plays the clip once at the configured volume",
          "[runner]") {
  Config config = alice_config();
  FakeTransport transport;
  FakeAudioDevice device;
  ShutdownSignal shutdown;
  transport.shutdown = &shutdown;
  transport.push(R"({"msgType":"bgm","audioUrl":"https://cdn.example/a.mp3"})");
  transport.push(R"({"msgType":"gameStatus","statusType":"died"})");
  transport.push(R"({"msgType":"gameStatus","statusType":"left"})");

  Runner runner(config, transport, device, shutdown);
  auto result = std::async(std::launch::async, [&runner] { return runner.run(); });

  REQUIRE(wait_until([&] { return device.started_count() == 1; }));
  // give any stray play a chance to show up
  std::this_thread::sleep_for(milliseconds(50));
  shutdown.trigger();

  REQUIRE(result.wait_for(seconds(5)) == std::future_status::ready);
  CHECK(result.get() == 0);

  auto started = device.started();
  REQUIRE(started.size() == 1);
  CHECK(started[0].clip == config.death_clip);
  CHECK_THAT(started[0].volume, Catch::Matchers::WithinAbs(0.8f, 1e-6));
  CHECK(transport.sent() == std::vector<std::string>{"alice"});
  CHECK(transport.urls() ==
        std::vector<std::string>{"ws://client.fe2.io:8081"});
}

TEST_CASE("Interrupt while running stops cleanly", "[runner]") {
  Config config = alice_config();
  FakeTransport transport;
  FakeAudioDevice device;
  ShutdownSignal shutdown;
  transport.shutdown = &shutdown;
  transport.push(R"({"msgType":"gameStatus","statusType":"died"})");

  Runner runner(config, transport, device, shutdown);
  auto result = std::async(std::launch::async, [&runner] { return runner.run(); });

  REQUIRE(wait_until([&] { return device.started_count() == 1; }));
  CHECK(runner.state() == RunnerState::Running);

  auto interrupted = steady_clock::now();
  shutdown.trigger();
  REQUIRE(result.wait_for(seconds(5)) == std::future_status::ready);
  CHECK(steady_clock::now() - interrupted < seconds(2));

  CHECK(result.get() == 0);
  CHECK(runner.state() == RunnerState::Stopped);
  CHECK_FALSE(transport.is_open());
  // the clip was still playing, shutdown released it
  CHECK(device.releases() == 1);
  CHECK(device.closed());
}

TEST_CASE("Unreachable server keeps retrying until interrupted", "[runner]") {
  Config config = alice_config();
  FakeTransport transport;
  FakeAudioDevice device;
  ShutdownSignal shutdown;
  transport.shutdown = &shutdown;
  transport.fail_next_opens(1000000);

  Runner runner(config, transport, device, shutdown);
  auto result = std::async(std::launch::async, [&runner] { return runner.run(); });

  REQUIRE(wait_until([&] { return transport.opens() >= 5; }));
  CHECK(runner.state() == RunnerState::Running);
  shutdown.trigger();

  REQUIRE(result.wait_for(seconds(5)) == std::future_status::ready);
  CHECK(result.get() == 0);
  CHECK(transport.sent().empty());
}

TEST_CASE("Connection loss while running reconnects and keeps dispatching",
          "[runner]") {
  Config config = alice_config();
  FakeTransport transport;
  FakeAudioDevice device;
  device.keep_playing = false;
  ShutdownSignal shutdown;
  transport.shutdown = &shutdown;

  Runner runner(config, transport, device, shutdown);
  auto result = std::async(std::launch::async, [&runner] { return runner.run(); });

  REQUIRE(wait_until([&] { return transport.sent().size() == 1; }));
  transport.fail_next_receive(ConnError::Io);
  REQUIRE(wait_until([&] { return transport.sent().size() == 2; }));

  transport.push(R"({"msgType":"gameStatus","statusType":"died"})");
  REQUIRE(wait_until([&] { return device.started_count() == 1; }));

  shutdown.trigger();
  REQUIRE(result.wait_for(seconds(5)) == std::future_status::ready);
  CHECK(result.get() == 0);
  CHECK(transport.sent() == std::vector<std::string>{"alice", "alice"});
}

TEST_CASE("Interrupt handlers last only as long as their owner", "[runner]") {
  ShutdownSignal shutdown;
  auto current_handler = [](int signum) {
    struct sigaction sa{};
    sigaction(signum, nullptr, &sa);
    return sa.sa_handler;
  };

  SECTION("SIGTERM triggers shutdown while installed") {
    InterruptHandlers interrupts(shutdown);
    REQUIRE(raise(SIGTERM) == 0);
    CHECK(shutdown.triggered());
  }

  SECTION("an exception unwinding past them restores the defaults") {
    try {
      InterruptHandlers interrupts(shutdown);
      CHECK(current_handler(SIGINT) != SIG_DFL);
      throw std::runtime_error("audio device gone");
    } catch (const std::runtime_error &ex) {
      CHECK(std::string(ex.what()) == "audio device gone");
    }
  }

  CHECK(current_handler(SIGINT) == SIG_DFL);
  CHECK(current_handler(SIGTERM) == SIG_DFL);
}
