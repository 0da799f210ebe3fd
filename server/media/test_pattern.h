/*
 * Synthetic Capture Source
 *
 * Animated BGRA test pattern and a sine tone, so a host can be exercised
 * end to end without a real screen or audio capture.
 */

#ifndef TEST_PATTERN_H
#define TEST_PATTERN_H

#include "audio_config.h"
#include <cmath>
#include <cstdint>
#include <vector>

namespace media {

// Fill a BGRA buffer (stride = width * 4) with frame number frame_num
inline void generate_test_frame(uint8_t* buffer, int width, int height, int frame_num) {
    const float t = frame_num * 0.05f;
    const float cx = 0.5f + 0.3f * sinf(t);
    const float cy = 0.5f + 0.3f * cosf(t * 0.7f);

    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            int idx = (y * width + x) * 4;
            float fx = (float)x / width;
            float fy = (float)y / height;
            float dist = sqrtf((fx - cx) * (fx - cx) + (fy - cy) * (fy - cy));

            uint8_t r, g, b;
            if (dist < 0.15f) {
                r = 255;
                g = 255;
                b = 255;
            } else {
                r = (uint8_t)(128 + 127 * sinf(fx * 3.14159f + t));
                g = (uint8_t)(128 + 127 * sinf(fy * 3.14159f + t * 1.3f));
                b = (uint8_t)(128 + 127 * sinf((fx + fy) * 3.14159f + t * 0.7f));
            }

            // Checkerboard in the corners shows scaling artefacts
            if ((x < 50 || x >= width - 50) && (y < 50 || y >= height - 50)) {
                bool check = ((x / 4) % 2) == ((y / 4) % 2);
                r = check ? 200 : 100;
                g = check ? 200 : 100;
                b = check ? 255 : 150;
            }

            buffer[idx + 0] = b;
            buffer[idx + 1] = g;
            buffer[idx + 2] = r;
            buffer[idx + 3] = 255;
        }
    }
}

class ToneGenerator {
public:
    ToneGenerator(int sample_rate = AUDIO_SAMPLE_RATE, int channels = AUDIO_CHANNELS)
        : sample_rate_(sample_rate)
        , channels_(channels)
        , phase_(0.0)
        , frequency_(440.0)  // A4
    {}

    void set_frequency(double freq) { frequency_ = freq; }

    // Interleaved 16-bit PCM
    std::vector<int16_t> generate_samples(int num_samples) {
        std::vector<int16_t> samples;
        samples.reserve(num_samples * channels_);

        const double phase_increment = 2.0 * M_PI * frequency_ / sample_rate_;
        const int16_t amplitude = 8192;  // ~25% volume

        for (int i = 0; i < num_samples; i++) {
            int16_t sample = static_cast<int16_t>(std::sin(phase_) * amplitude);
            for (int ch = 0; ch < channels_; ch++) {
                samples.push_back(sample);
            }
            phase_ += phase_increment;
            if (phase_ >= 2.0 * M_PI) {
                phase_ -= 2.0 * M_PI;
            }
        }
        return samples;
    }

    // One Opus frame (20ms)
    std::vector<int16_t> generate_frame() {
        return generate_samples(sample_rate_ * AUDIO_FRAME_DURATION_MS / 1000);
    }

private:
    int sample_rate_;
    int channels_;
    double phase_;
    double frequency_;
};

} // namespace media

#endif // TEST_PATTERN_H
