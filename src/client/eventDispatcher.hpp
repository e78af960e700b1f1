#pragma once
#include "audioEngine.hpp"
#include "config.hpp"
#include "gameEvent.hpp"

// Maps decoded events to audio cues. Holds no state between calls.
struct EventDispatcher {
private:
  AudioEngine &audio;
  const Config &config;

public:
  EventDispatcher(AudioEngine &audio, const Config &config);

  void dispatch(const GameEvent &event);
};
