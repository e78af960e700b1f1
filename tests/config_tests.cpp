#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

#include "../src/common/config.hpp"
#include "../src/common/errors.hpp"
#include "../src/common/volume.hpp"

namespace {

// Writes contents to a fresh file under the temp dir, removed on scope exit
struct TempFile {
  static inline int counter = 0;
  std::string path;
  explicit TempFile(const std::string &contents) {
    path = (std::filesystem::temp_directory_path() /
            ("deathcue_config_" + std::to_string(counter++) + ".json"))
               .string();
    std::ofstream out(path);
    out << contents;
  }
  ~TempFile() { std::remove(path.c_str()); }
};

} // namespace

TEST_CASE("clamp_volume keeps volume inside [0, 1]", "[config]") {
  SECTION("Inside range") {
    CHECK(clamp_volume(0.0f) == 0.0f);
    CHECK(clamp_volume(0.5f) == 0.5f);
    CHECK(clamp_volume(1.0f) == 1.0f);
  }

  SECTION("Below range") {
    CHECK(clamp_volume(-0.1f) == 0.0f);
    CHECK(clamp_volume(-1000.0f) == 0.0f);
    CHECK(clamp_volume(-std::numeric_limits<float>::infinity()) == 0.0f);
  }

  SECTION("Above range") {
    CHECK(clamp_volume(1.01f) == 1.0f);
    CHECK(clamp_volume(80.0f) == 1.0f);
    CHECK(clamp_volume(std::numeric_limits<float>::infinity()) == 1.0f);
  }

  SECTION("NaN") { CHECK(clamp_volume(std::nanf("")) == 0.0f); }
}

TEST_CASE("parse_arguments", "[config]") {
  Config config;

  SECTION("Username only uses defaults") {
    const char *argv[] = {"deathcue", "alice"};
    REQUIRE(parse_arguments(2, argv, config));
    CHECK(config.username == "alice");
    CHECK_THAT(config.volume, Catch::Matchers::WithinAbs(0.5f, 1e-6));
    CHECK(config.server_url == "ws://client.fe2.io:8081");
  }

  SECTION("Volume and url") {
    const char *argv[] = {"deathcue", "alice", "0.8", "ws://localhost:9000"};
    REQUIRE(parse_arguments(4, argv, config));
    CHECK_THAT(config.volume, Catch::Matchers::WithinAbs(0.8f, 1e-6));
    CHECK(config.server_url == "ws://localhost:9000");
  }

  SECTION("Volume is clamped on load") {
    const char *high[] = {"deathcue", "alice", "1.5"};
    REQUIRE(parse_arguments(3, high, config));
    CHECK(config.volume == 1.0f);

    const char *low[] = {"deathcue", "alice", "-3"};
    REQUIRE(parse_arguments(3, low, config));
    CHECK(config.volume == 0.0f);
  }

  SECTION("Missing username") {
    const char *argv[] = {"deathcue"};
    CHECK_THROWS_AS(parse_arguments(1, argv, config), InvalidConfig);
  }

  SECTION("Empty username") {
    const char *argv[] = {"deathcue", ""};
    CHECK_THROWS_AS(parse_arguments(2, argv, config), InvalidConfig);
  }

  SECTION("Volume that isn't a number") {
    const char *argv[] = {"deathcue", "alice", "loud"};
    CHECK_THROWS_AS(parse_arguments(3, argv, config), InvalidConfig);

    const char *trailing[] = {"deathcue", "alice", "0.5x"};
    CHECK_THROWS_AS(parse_arguments(3, trailing, config), InvalidConfig);
  }

  SECTION("Too many arguments") {
    const char *argv[] = {"deathcue", "alice", "0.5", "ws://a", "extra"};
    CHECK_THROWS_AS(parse_arguments(5, argv, config), InvalidConfig);
  }

  SECTION("Help wins over everything else") {
    const char *argv[] = {"deathcue", "--help"};
    CHECK_FALSE(parse_arguments(2, argv, config));

    const char *short_flag[] = {"deathcue", "alice", "-h"};
    CHECK_FALSE(parse_arguments(3, short_flag, config));
  }
}

TEST_CASE("read_config_file", "[config]") {
  Config config;

  SECTION("Missing file keeps defaults") {
    read_config_file("/nonexistent/deathcue/client.json", config);
    CHECK(config.death_clip == Constants::DEFAULT_DEATH_CLIP);
    CHECK(config.backoff.initial.count() == 1000);
    CHECK(config.backoff.max.count() == 30000);
    CHECK(config.log_level == LOG_INFO);
  }

  SECTION("Overrides") {
    TempFile file(R"({
      "death_clip": "sounds/oof.ogg",
      "log_level": "debug",
      "backoff_initial_ms": 250,
      "backoff_max_ms": 4000,
      "backoff_multiplier": 3,
      "backoff_jitter": 0.0,
      "something_new": true
    })");
    read_config_file(file.path, config);
    CHECK(config.death_clip == "sounds/oof.ogg");
    CHECK(config.log_level == LOG_DEBUG);
    CHECK(config.backoff.initial.count() == 250);
    CHECK(config.backoff.max.count() == 4000);
    CHECK(config.backoff.multiplier == 3.0);
    CHECK(config.backoff.jitter_ratio == 0.0);
  }

  SECTION("Malformed json") {
    TempFile file("{ \"death_clip\": ");
    CHECK_THROWS_AS(read_config_file(file.path, config), InvalidConfig);
  }

  SECTION("Wrong types") {
    TempFile clip(R"({"death_clip": 5})");
    CHECK_THROWS_AS(read_config_file(clip.path, config), InvalidConfig);

    TempFile delay(R"({"backoff_initial_ms": -5})");
    CHECK_THROWS_AS(read_config_file(delay.path, config), InvalidConfig);
  }

  SECTION("Unknown log level") {
    TempFile file(R"({"log_level": "chatty"})");
    CHECK_THROWS_AS(read_config_file(file.path, config), InvalidConfig);
  }
}

TEST_CASE("validate_config", "[config]") {
  Config config;
  config.username = "alice";
  CHECK_NOTHROW(validate_config(config));

  SECTION("Empty username") {
    config.username = "";
    CHECK_THROWS_AS(validate_config(config), InvalidConfig);
  }

  SECTION("Backoff cap below the initial delay") {
    config.backoff.initial = std::chrono::milliseconds(5000);
    config.backoff.max = std::chrono::milliseconds(1000);
    CHECK_THROWS_AS(validate_config(config), InvalidConfig);
  }

  SECTION("Shrinking multiplier") {
    config.backoff.multiplier = 0.5;
    CHECK_THROWS_AS(validate_config(config), InvalidConfig);
  }
}
