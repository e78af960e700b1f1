#include "messageParser.hpp"

#include <initializer_list>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const std::string TYPE_GAME_STATUS = "gameStatus";
const std::string TYPE_BGM = "bgm";
const std::string STATUS_DIED = "died";
const std::string STATUS_LEFT = "left";

// returns true if one of the keys holds a string; the first match wins
bool string_field(const json &j, std::initializer_list<const char *> keys,
                  std::string &value) {
  for (const char *key : keys) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
      value = it->get<std::string>();
      return true;
    }
  }
  return false;
}

} // namespace

GameEvent parse_message(const std::string &raw) {
  GameEvent event;
  event.raw = raw;

  json j = json::parse(raw, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return event;
  }

  std::string msg_type;
  if (!string_field(j, {"msgType", "msg_type", "type"}, msg_type)) {
    return event;
  }

  if (msg_type == TYPE_GAME_STATUS) {
    std::string status;
    if (!string_field(j, {"statusType", "status_type"}, status)) {
      return event;
    }
    if (status == STATUS_DIED) {
      event.type = GameEventType::Death;
    } else if (status == STATUS_LEFT) {
      event.type = GameEventType::RoundEnd;
    }
  } else if (msg_type == TYPE_BGM) {
    event.type = GameEventType::RoundStart;
    string_field(j, {"audioUrl", "audio_url"}, event.audio_url);
  }

  return event;
}
