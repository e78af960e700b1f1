#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "audioDevice.hpp"

struct PlaybackRequest {
  std::string clip;
  float volume = 0.0f;
};

// Sole owner of the output device. play() hands every request to its own
// worker thread and returns immediately, so overlapping cues each get an
// independent voice.
struct AudioEngine {
private:
  struct Voice {
    std::thread worker;
    std::atomic_bool done = false;
  };

  AudioDevice &device;

  // guards every call into device and _open
  std::mutex device_mutex;
  bool _open = false;

  // guards voices and _stopping
  std::mutex voices_mutex;
  std::condition_variable stop_cv;
  std::list<std::unique_ptr<Voice>> voices;
  bool _stopping = false;

  void playback(Voice *voice, PlaybackRequest request);
  void reap_finished();

public:
  explicit AudioEngine(AudioDevice &device);
  ~AudioEngine();
  AudioEngine(const AudioEngine &) = delete;
  AudioEngine &operator=(const AudioEngine &) = delete;

  // Throws AudioInitError if the device or any clip can't be opened
  void open(const std::vector<std::string> &clips);

  // returns true if playback was started on a worker; false is a skipped cue
  bool play(const std::string &clip, float volume);

  // Stops in-flight voices, waits for their workers and closes the device.
  // play() is refused afterwards.
  void drain();

  size_t in_flight();
  bool is_open();
};
