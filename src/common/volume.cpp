#include "volume.hpp"

#include <cmath>

float clamp_volume(float volume) {
  if (std::isnan(volume) || volume < 0.0f) {
    return 0.0f;
  }
  if (volume > 1.0f) {
    return 1.0f;
  }
  return volume;
}
