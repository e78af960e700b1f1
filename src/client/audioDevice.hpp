#pragma once
#include <string>

// Output device boundary. Implementations need not be thread safe,
// AudioEngine serializes every call.
struct AudioDevice {
  virtual ~AudioDevice() = default;

  // returns true if the device is ready for playback
  virtual bool init() = 0;
  virtual void close() = 0;

  // returns true if the clip can be started afterwards
  virtual bool load_clip(const std::string &clip) = 0;

  // Starts an independent voice of a loaded clip.
  // returns the voice id, -1 on failure
  virtual int start(const std::string &clip, float volume) = 0;
  virtual bool is_playing(int voice) = 0;
  virtual void stop(int voice) = 0;
  // Frees the voice, the id is invalid afterwards
  virtual void release(int voice) = 0;
};
