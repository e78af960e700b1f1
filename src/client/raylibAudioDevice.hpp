#pragma once
#include <map>
#include <raylib.h>
#include <string>

#include "audioDevice.hpp"

// Clips are loaded once with LoadSound, every voice is a LoadSoundAlias of
// its clip so the same clip can overlap itself.
struct RaylibAudioDevice : public AudioDevice {
private:
  std::map<std::string, Sound> clips;
  std::map<int, Sound> voices;
  int next_voice = 1;
  bool ready = false;

public:
  RaylibAudioDevice() = default;
  ~RaylibAudioDevice() override;

  bool init() override;
  void close() override;
  bool load_clip(const std::string &clip) override;
  int start(const std::string &clip, float volume) override;
  bool is_playing(int voice) override;
  void stop(int voice) override;
  void release(int voice) override;
};
