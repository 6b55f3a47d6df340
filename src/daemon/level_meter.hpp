#pragma once

#include <span>

namespace level_meter {

// Root mean square of a block of samples; 0 for an empty block.
float rms(std::span<const float> samples);

// Maps an RMS amplitude to [0,1] on a dB scale: -60 dB and below -> 0,
// 0 dB -> 1.
float normalize(float rms);

} // namespace level_meter
