#include "config.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>

#include "errors.hpp"
#include "volume.hpp"

using namespace std::chrono;

static float read_volume(const char *txt) {
  char *ptr;
  float volume = strtof(txt, &ptr);
  if (*txt == 0 || *ptr != 0) {
    throw InvalidConfig{std::string("volume is not a number: ") + txt};
  }
  return clamp_volume(volume);
}

bool parse_arguments(int argc, const char *const *argv, Config &config) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      return false;
    }
  }

  if (argc < 2) {
    throw InvalidConfig{"missing username"};
  }
  if (argc > 4) {
    throw InvalidConfig{"too many arguments"};
  }

  config.username = argv[1];
  if (argc > 2) {
    config.volume = read_volume(argv[2]);
  }
  if (argc > 3) {
    config.server_url = argv[3];
  }

  validate_config(config);
  return true;
}

void read_config_file(const std::string &path, Config &config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    TraceLog(LOG_DEBUG, "CONFIG: No config file at %s, using defaults",
             path.c_str());
    return;
  }

  json config_json = json::parse(file, nullptr, false);
  file.close();
  if (config_json.is_discarded() || !config_json.is_object()) {
    throw InvalidConfig{"couldn't parse " + path};
  }

  try {
    from_json(config_json, config);
  } catch (json::exception &ex) {
    throw InvalidConfig{"unexpected value in " + path + ": " + ex.what()};
  }
  TraceLog(LOG_DEBUG, "CONFIG: Loaded %s", path.c_str());
}

void validate_config(const Config &config) {
  if (config.username.empty()) {
    throw InvalidConfig{"username must not be empty"};
  }
  if (config.volume < 0.0f || config.volume > 1.0f ||
      std::isnan(config.volume)) {
    throw InvalidConfig{"volume must be between 0 and 1"};
  }
  if (config.server_url.empty()) {
    throw InvalidConfig{"server url must not be empty"};
  }
  if (config.death_clip.empty()) {
    throw InvalidConfig{"death clip must not be empty"};
  }
  if (config.backoff.initial.count() <= 0 ||
      config.backoff.max < config.backoff.initial) {
    throw InvalidConfig{"backoff delays must be positive and initial <= max"};
  }
  if (config.backoff.multiplier < 1.0) {
    throw InvalidConfig{"backoff multiplier must be at least 1"};
  }
  if (config.backoff.jitter_ratio < 0.0 || config.backoff.jitter_ratio > 1.0) {
    throw InvalidConfig{"backoff jitter must be between 0 and 1"};
  }
}

const std::string usage(const std::string &program) {
  return "Usage: " + program + " <username> [volume] [server_url]\n"
         "  username    player to track\n"
         "  volume      death cue volume, 0.0 - 1.0 (default " +
         std::to_string(Constants::DEFAULT_VOLUME).substr(0, 3) + ")\n"
         "  server_url  event server (default " +
         Constants::DEFAULT_SERVER_URL + ")\n";
}

static milliseconds read_delay(const json &j, const std::string &key) {
  if (!j.at(key).is_number_integer() || j.at(key).get<int64_t>() <= 0) {
    throw InvalidConfig{key + " must be a positive integer"};
  }
  return milliseconds(j.at(key).get<int64_t>());
}

void from_json(const json &j, Config &c) {
  if (j.contains("death_clip")) {
    c.death_clip = j.at("death_clip").get<std::string>();
  }
  if (j.contains("log_level")) {
    if (!j.at("log_level").is_string()) {
      throw InvalidConfig{"log_level must be a string"};
    }
    c.log_level = j.at("log_level").get<TraceLogLevel>();
    if (c.log_level == LOG_NONE) {
      throw InvalidConfig{"unknown log_level " +
                          j.at("log_level").get<std::string>()};
    }
  }
  if (j.contains("backoff_initial_ms")) {
    c.backoff.initial = read_delay(j, "backoff_initial_ms");
  }
  if (j.contains("backoff_max_ms")) {
    c.backoff.max = read_delay(j, "backoff_max_ms");
  }
  if (j.contains("backoff_multiplier")) {
    c.backoff.multiplier = j.at("backoff_multiplier").get<double>();
  }
  if (j.contains("backoff_jitter")) {
    c.backoff.jitter_ratio = j.at("backoff_jitter").get<double>();
  }
}
