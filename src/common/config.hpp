#pragma once
#include <nlohmann/json.hpp>
#include <raylib.h>
#include <string>

#include "backoff.hpp"
#include "constants.hpp"

using json = nlohmann::json;

NLOHMANN_JSON_SERIALIZE_ENUM(TraceLogLevel, {{LOG_NONE, nullptr},
                                             {LOG_DEBUG, "debug"},
                                             {LOG_INFO, "info"},
                                             {LOG_WARNING, "warning"},
                                             {LOG_ERROR, "error"}})

// Loaded once at startup, read-only afterwards
struct Config {
  std::string username;
  float volume = Constants::DEFAULT_VOLUME;
  std::string server_url = Constants::DEFAULT_SERVER_URL;
  std::string death_clip = Constants::DEFAULT_DEATH_CLIP;
  BackoffPolicy backoff;
  TraceLogLevel log_level = LOG_INFO;
};

// NOTE: The functions below throw InvalidConfig.

// Fills username, volume and server_url from
// `program <username> [volume] [server_url]`.
// returns false if usage was requested instead
bool parse_arguments(int argc, const char *const *argv, Config &config);

// Optional overrides for the remaining fields. A missing file is not an error.
void read_config_file(const std::string &path, Config &config);

void validate_config(const Config &config);

const std::string usage(const std::string &program);

void from_json(const json &j, Config &c);
