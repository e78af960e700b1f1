#pragma once
#include <string>

enum class GameEventType {
  Death,
  RoundStart,
  RoundEnd,
  Unknown,
};

// Decoded server notification. raw is the frame it was decoded from,
// audio_url is only set on RoundStart.
struct GameEvent {
  GameEventType type = GameEventType::Unknown;
  std::string raw;
  std::string audio_url;

  bool operator==(const GameEvent &other) const {
    return type == other.type && raw == other.raw &&
           audio_url == other.audio_url;
  }
  bool operator!=(const GameEvent &other) const { return !(*this == other); }
};

const std::string game_event_to_string(GameEventType type);
