#include "gameEvent.hpp"

// Only used in logs
const std::string game_event_to_string(GameEventType type) {
  switch (type) {
  case GameEventType::Death:
    return "Death";
  case GameEventType::RoundStart:
    return "RoundStart";
  case GameEventType::RoundEnd:
    return "RoundEnd";
  case GameEventType::Unknown:
    return "Unknown";
  default:
    return "Unknown";
  }
}
