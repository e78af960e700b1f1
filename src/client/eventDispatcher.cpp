#include "eventDispatcher.hpp"

#include <raylib.h>

#include "volume.hpp"

EventDispatcher::EventDispatcher(AudioEngine &audio, const Config &config)
    : audio(audio), config(config) {}

void EventDispatcher::dispatch(const GameEvent &event) {
  switch (event.type) {
  case GameEventType::Death:
    TraceLog(LOG_INFO, "EVENT: %s died", config.username.c_str());
    if (!audio.play(config.death_clip, clamp_volume(config.volume))) {
      TraceLog(LOG_WARNING, "EVENT: Death cue skipped");
    }
    break;
  case GameEventType::RoundStart:
    // no policy for round music yet
    TraceLog(LOG_DEBUG, "EVENT: Round started (%s)", event.audio_url.c_str());
    break;
  case GameEventType::RoundEnd:
    TraceLog(LOG_DEBUG, "EVENT: Round ended");
    break;
  case GameEventType::Unknown:
    TraceLog(LOG_DEBUG, "EVENT: Ignoring message %s", event.raw.c_str());
    break;
  }
}
