#include "raylibAudioDevice.hpp"

RaylibAudioDevice::~RaylibAudioDevice() { close(); }

bool RaylibAudioDevice::init() {
  if (ready) {
    return true;
  }
  InitAudioDevice();
  ready = IsAudioDeviceReady();
  if (!ready) {
    TraceLog(LOG_ERROR, "AUDIO: Couldn't initialize the output device");
  }
  return ready;
}

void RaylibAudioDevice::close() {
  for (auto &voice : voices) {
    StopSound(voice.second);
    UnloadSoundAlias(voice.second);
  }
  voices.clear();
  for (auto &clip : clips) {
    UnloadSound(clip.second);
  }
  clips.clear();
  if (ready) {
    CloseAudioDevice();
    ready = false;
  }
}

bool RaylibAudioDevice::load_clip(const std::string &clip) {
  if (!ready) {
    return false;
  }
  if (clips.count(clip) > 0) {
    return true;
  }
  if (!FileExists(clip.c_str())) {
    TraceLog(LOG_ERROR, "AUDIO: Clip %s doesn't exist", clip.c_str());
    return false;
  }

  // LoadSound() returns a zeroed Sound if the file can't be decoded
  Sound sound = LoadSound(clip.c_str());
  if (sound.frameCount == 0) {
    TraceLog(LOG_ERROR, "AUDIO: Couldn't decode clip %s", clip.c_str());
    return false;
  }
  clips[clip] = sound;
  return true;
}

int RaylibAudioDevice::start(const std::string &clip, float volume) {
  auto it = clips.find(clip);
  if (!ready || it == clips.end()) {
    return -1;
  }

  Sound alias = LoadSoundAlias(it->second);
  if (alias.stream.buffer == nullptr) {
    return -1;
  }
  SetSoundVolume(alias, volume);
  PlaySound(alias);

  int id = next_voice++;
  voices[id] = alias;
  return id;
}

bool RaylibAudioDevice::is_playing(int voice) {
  auto it = voices.find(voice);
  return it != voices.end() && IsSoundPlaying(it->second);
}

void RaylibAudioDevice::stop(int voice) {
  auto it = voices.find(voice);
  if (it != voices.end()) {
    StopSound(it->second);
  }
}

void RaylibAudioDevice::release(int voice) {
  auto it = voices.find(voice);
  if (it == voices.end()) {
    return;
  }
  UnloadSoundAlias(it->second);
  voices.erase(it);
}
