/*
 * Opus Audio Encoder Implementation
 */

#include "opus_encoder.h"
#include <cstdio>

namespace media {

OpusAudioEncoder::OpusAudioEncoder() {}

OpusAudioEncoder::~OpusAudioEncoder() {
    cleanup();
}

bool OpusAudioEncoder::init(int sample_rate, int channels, int bitrate) {
    cleanup();

    sample_rate_ = sample_rate;
    channels_ = channels;
    bitrate_ = bitrate;
    frame_size_ = (sample_rate_ * AUDIO_FRAME_DURATION_MS) / 1000;

    int error = OPUS_OK;
    encoder_ = opus_encoder_create(sample_rate_, channels_, OPUS_APPLICATION_AUDIO, &error);
    if (error != OPUS_OK || !encoder_) {
        fprintf(stderr, "[Opus] Failed to create encoder: %s\n", opus_strerror(error));
        encoder_ = nullptr;
        return false;
    }

    opus_encoder_ctl(encoder_, OPUS_SET_BITRATE(bitrate_));
    opus_encoder_ctl(encoder_, OPUS_SET_COMPLEXITY(OPUS_COMPLEXITY));
    opus_encoder_ctl(encoder_, OPUS_SET_SIGNAL(OPUS_SIGNAL_TYPE));
    opus_encoder_ctl(encoder_, OPUS_SET_INBAND_FEC(OPUS_INBAND_FEC));
    opus_encoder_ctl(encoder_, OPUS_SET_PACKET_LOSS_PERC(OPUS_PACKET_LOSS_PERC));

    return true;
}

void OpusAudioEncoder::cleanup() {
    if (encoder_) {
        opus_encoder_destroy(encoder_);
        encoder_ = nullptr;
    }
}

bool OpusAudioEncoder::set_bitrate(int bitrate) {
    bitrate_ = bitrate;
    if (!encoder_) {
        return true;
    }
    int ret = opus_encoder_ctl(encoder_, OPUS_SET_BITRATE(bitrate));
    if (ret != OPUS_OK) {
        fprintf(stderr, "[Opus] Failed to set bitrate %d: %s\n", bitrate, opus_strerror(ret));
        return false;
    }
    return true;
}

std::vector<uint8_t> OpusAudioEncoder::encode(const int16_t* pcm, int frame_size) {
    if (!encoder_) {
        fprintf(stderr, "[Opus] Encoder not initialized\n");
        return {};
    }

    if (frame_size != frame_size_) {
        fprintf(stderr, "[Opus] Frame size mismatch: expected %d, got %d\n", frame_size_, frame_size);
        return {};
    }

    std::vector<uint8_t> output(4000);  // Max Opus packet size
    int encoded_bytes = opus_encode(encoder_, pcm, frame_size, output.data(),
                                    static_cast<opus_int32>(output.size()));
    if (encoded_bytes < 0) {
        fprintf(stderr, "[Opus] Encode error: %s\n", opus_strerror(encoded_bytes));
        return {};
    }

    output.resize(encoded_bytes);
    return output;
}

} // namespace media
