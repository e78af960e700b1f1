#include "audioEngine.hpp"

#include <chrono>
#include <raylib.h>
#include <system_error>

#include "constants.hpp"
#include "errors.hpp"
#include "volume.hpp"

AudioEngine::AudioEngine(AudioDevice &device) : device(device) {}

AudioEngine::~AudioEngine() { drain(); }

void AudioEngine::open(const std::vector<std::string> &clips) {
  std::lock_guard<std::mutex> lock(device_mutex);
  if (_open) {
    return;
  }
  if (!device.init()) {
    throw AudioInitError{"couldn't open the audio output device"};
  }
  for (const auto &clip : clips) {
    if (!device.load_clip(clip)) {
      device.close();
      throw AudioInitError{"couldn't load clip " + clip};
    }
  }
  _open = true;
  TraceLog(LOG_INFO, "AUDIO: Output device ready, %lu clip(s) loaded",
           clips.size());
}

bool AudioEngine::is_open() {
  std::lock_guard<std::mutex> lock(device_mutex);
  return _open;
}

bool AudioEngine::play(const std::string &clip, float volume) {
  if (!is_open()) {
    TraceLog(LOG_WARNING, "AUDIO: Device closed, skipping %s", clip.c_str());
    return false;
  }

  PlaybackRequest request{clip, clamp_volume(volume)};

  std::lock_guard<std::mutex> lock(voices_mutex);
  if (_stopping) {
    return false;
  }
  reap_finished();

  auto voice = std::make_unique<Voice>();
  try {
    voice->worker =
        std::thread(&AudioEngine::playback, this, voice.get(), request);
  } catch (const std::system_error &ex) {
    TraceLog(LOG_WARNING, "AUDIO: Couldn't spawn playback worker: %s",
             ex.what());
    return false;
  }
  voices.push_back(std::move(voice));
  return true;
}

void AudioEngine::playback(Voice *voice, PlaybackRequest request) {
  int id;
  {
    std::lock_guard<std::mutex> lock(device_mutex);
    id = _open ? device.start(request.clip, request.volume) : -1;
  }
  if (id < 0) {
    TraceLog(LOG_WARNING, "AUDIO: Couldn't play %s, cue skipped",
             request.clip.c_str());
    voice->done = true;
    return;
  }
  TraceLog(LOG_DEBUG, "AUDIO: Playing %s at volume %.2f (voice %d)",
           request.clip.c_str(), request.volume, id);

  bool stopped = false;
  while (true) {
    {
      std::lock_guard<std::mutex> lock(device_mutex);
      if (!device.is_playing(id)) {
        break;
      }
    }
    std::unique_lock<std::mutex> lock(voices_mutex);
    if (stop_cv.wait_for(
            lock, std::chrono::milliseconds(Constants::AUDIO_POLL_MILISECONDS),
            [this] { return _stopping; })) {
      stopped = true;
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(device_mutex);
    if (stopped) {
      device.stop(id);
    }
    device.release(id);
  }
  voice->done = true;
}

// voices_mutex must be held
void AudioEngine::reap_finished() {
  for (auto it = voices.begin(); it != voices.end();) {
    if ((*it)->done) {
      if ((*it)->worker.joinable()) {
        (*it)->worker.join();
      }
      it = voices.erase(it);
    } else {
      ++it;
    }
  }
}

size_t AudioEngine::in_flight() {
  std::lock_guard<std::mutex> lock(voices_mutex);
  size_t count = 0;
  for (const auto &voice : voices) {
    if (!voice->done) {
      count++;
    }
  }
  return count;
}

void AudioEngine::drain() {
  std::list<std::unique_ptr<Voice>> pending;
  {
    std::lock_guard<std::mutex> lock(voices_mutex);
    _stopping = true;
    pending.swap(voices);
  }
  stop_cv.notify_all();

  for (auto &voice : pending) {
    if (voice->worker.joinable()) {
      voice->worker.join();
    }
  }

  std::lock_guard<std::mutex> lock(device_mutex);
  if (_open) {
    device.close();
    _open = false;
    TraceLog(LOG_INFO, "AUDIO: Output device released");
  }
}
