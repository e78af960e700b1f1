#pragma once
#include <string>

#include "gameEvent.hpp"

// Decodes one server frame. Never fails: anything that isn't a recognised
// notification comes back as GameEventType::Unknown carrying the raw text.
GameEvent parse_message(const std::string &raw);
