/*
 * Quality Presets
 *
 * Fixed ladder of encoding limits, highest fidelity first.
 */

#ifndef QUALITY_PRESET_H
#define QUALITY_PRESET_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace quality {

struct VideoLimits {
    uint32_t max_bitrate_bps = 0;
    int max_framerate = 0;
    double scale_down_factor = 1.0;   // 1.0 = full capture resolution
};

struct AudioLimits {
    uint32_t max_bitrate_bps = 0;
};

struct EncodingLimits {
    VideoLimits video;
    AudioLimits audio;
};

struct QualityPreset {
    const char* key;
    const char* name;
    EncodingLimits limits;
};

constexpr size_t PRESET_COUNT = 5;

// ultra, high, medium, low, minimal
const std::array<QualityPreset, PRESET_COUNT>& preset_ladder();

// Position on the ladder (0 = ultra), nullopt for an unknown key
std::optional<size_t> preset_index(const std::string& key);

// Preset a measured bandwidth (bits/sec) supports
size_t preset_index_for_bandwidth(double bandwidth_bps);

} // namespace quality

#endif // QUALITY_PRESET_H
