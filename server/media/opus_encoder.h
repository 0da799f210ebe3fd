/*
 * Opus Audio Encoder
 *
 * One per link. Input is interleaved S16 PCM in AUDIO_FRAME_SIZE frames.
 */

#ifndef OPUS_ENCODER_H
#define OPUS_ENCODER_H

#include <opus/opus.h>
#include <vector>
#include <cstdint>
#include "audio_config.h"

namespace media {

class OpusAudioEncoder {
public:
    OpusAudioEncoder();
    ~OpusAudioEncoder();

    OpusAudioEncoder(const OpusAudioEncoder&) = delete;
    OpusAudioEncoder& operator=(const OpusAudioEncoder&) = delete;

    bool init(int sample_rate = AUDIO_SAMPLE_RATE, int channels = AUDIO_CHANNELS,
              int bitrate = OPUS_DEFAULT_BITRATE);
    void cleanup();
    bool is_initialized() const { return encoder_ != nullptr; }

    // Takes effect from the next encoded frame
    bool set_bitrate(int bitrate);
    int get_bitrate() const { return bitrate_; }

    // Encode one frame; empty result on error
    std::vector<uint8_t> encode(const int16_t* pcm, int frame_size);

    int get_frame_size() const { return frame_size_; }
    int get_sample_rate() const { return sample_rate_; }
    int get_channels() const { return channels_; }

private:
    OpusEncoder* encoder_ = nullptr;
    int sample_rate_ = AUDIO_SAMPLE_RATE;
    int channels_ = AUDIO_CHANNELS;
    int frame_size_ = AUDIO_FRAME_SIZE;
    int bitrate_ = OPUS_DEFAULT_BITRATE;
};

} // namespace media

#endif // OPUS_ENCODER_H
