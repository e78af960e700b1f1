#pragma once
#include <cstddef>
#include <string>

namespace Constants {
const static std::string programName = "deathcue";

const static std::string DEFAULT_SERVER_URL = "ws://client.fe2.io:8081";
const static float DEFAULT_VOLUME = 0.5f;
const static std::string DEFAULT_DEATH_CLIP = "resources/sounds/death.wav";
const static std::string CONFIG_FILE_PATH = "resources/client.json";

const static int BACKOFF_INITIAL_MILISECONDS = 1000;
const static int BACKOFF_MAX_MILISECONDS = 30000;
const static double BACKOFF_MULTIPLIER = 2.0;
const static double BACKOFF_JITTER_RATIO = 0.1;

const static int CONNECTION_TIMEOUT_MILISECONDS = 5000;
// a ping goes out halfway through, silence for the full period drops the link
const static int IDLE_TIMEOUT_MILISECONDS = 20000;
const static int CLOSE_TIMEOUT_MILISECONDS = 1000;
const static size_t MESSAGE_MAX_SIZE = 1 << 20;

const static int AUDIO_POLL_MILISECONDS = 20;
} // namespace Constants
