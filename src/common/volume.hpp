#pragma once

// NaN clamps to 0
float clamp_volume(float volume);
