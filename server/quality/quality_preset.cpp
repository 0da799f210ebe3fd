/*
 * Quality Presets Implementation
 */

#include "quality_preset.h"

namespace quality {

static const std::array<QualityPreset, PRESET_COUNT> PRESETS = {{
    {"ultra",   "Ultra (1080p)",  {{4000000, 60, 1.0},  {128000}}},
    {"high",    "High (720p)",    {{2500000, 30, 1.5},  {96000}}},
    {"medium",  "Medium (480p)",  {{1200000, 30, 2.25}, {64000}}},
    {"low",     "Low (360p)",     {{600000,  24, 3.0},  {48000}}},
    {"minimal", "Minimal (240p)", {{300000,  15, 4.5},  {32000}}},
}};

const std::array<QualityPreset, PRESET_COUNT>& preset_ladder() {
    return PRESETS;
}

std::optional<size_t> preset_index(const std::string& key) {
    for (size_t i = 0; i < PRESETS.size(); i++) {
        if (key == PRESETS[i].key) {
            return i;
        }
    }
    return std::nullopt;
}

size_t preset_index_for_bandwidth(double bandwidth_bps) {
    if (bandwidth_bps < 400000) return 4;    // minimal
    if (bandwidth_bps < 800000) return 3;    // low
    if (bandwidth_bps < 1500000) return 2;   // medium
    if (bandwidth_bps < 3000000) return 1;   // high
    return 0;                                // ultra
}

} // namespace quality
