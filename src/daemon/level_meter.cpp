#include "level_meter.hpp"

#include <algorithm>
#include <cmath>

namespace level_meter {

float rms(std::span<const float> samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (float s : samples) sum += static_cast<double>(s) * s;
    return static_cast<float>(std::sqrt(sum / samples.size()));
}

float normalize(float rms) {
    constexpr float FLOOR_DB = -60.0f;
    float db = 20.0f * std::log10(std::max(rms, 0.0001f));
    return std::clamp((db - FLOOR_DB) / -FLOOR_DB, 0.0f, 1.0f);
}

} // namespace level_meter
