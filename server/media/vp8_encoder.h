/*
 * VP8 Encoder using libvpx
 *
 * One per link. Takes BGRA frames at capture resolution and applies the
 * link's encoding limits:
 * - target bitrate (CBR)
 * - frame-rate cap: frames arriving faster than max_framerate are skipped
 * - resolution scale-down, rounded to even dimensions (libyuv)
 */

#ifndef VP8_ENCODER_H
#define VP8_ENCODER_H

#include <vpx/vpx_encoder.h>
#include <vpx/vp8cx.h>
#include <cstdint>
#include <vector>

namespace media {

struct EncodedFrame {
    std::vector<uint8_t> data;
    bool is_keyframe = false;
    int width = 0;
    int height = 0;
    uint64_t timestamp_us = 0;
};

class VP8Encoder {
public:
    VP8Encoder() = default;
    ~VP8Encoder() { cleanup(); }

    VP8Encoder(const VP8Encoder&) = delete;
    VP8Encoder& operator=(const VP8Encoder&) = delete;

    // Applied on the next frame; a changed output size reinitializes the encoder
    void set_limits(uint32_t bitrate_bps, int max_framerate, double scale_down_factor);

    /**
     * Encode a BGRA frame
     * @param timestamp_us Capture time; used for the frame-rate cap
     * @return false when the frame was skipped or encoding failed
     */
    bool encode_bgra(const uint8_t* bgra, int width, int height, int stride,
                     uint64_t timestamp_us, EncodedFrame& out);

    void request_keyframe() { force_keyframe_ = true; }
    void cleanup();

    uint32_t bitrate_bps() const { return bitrate_bps_; }
    int max_framerate() const { return max_fps_; }
    double scale_down_factor() const { return scale_; }

    // Output size for a given capture size under the current scale
    static void scaled_size(int width, int height, double scale, int& out_width, int& out_height);

private:
    bool init(int width, int height);
    bool apply_bitrate();

    vpx_codec_ctx_t codec_ = {};
    vpx_codec_enc_cfg_t config_ = {};
    bool initialized_ = false;

    int width_ = 0;             // encoded (scaled) size
    int height_ = 0;
    uint32_t bitrate_bps_ = 2500000;
    int max_fps_ = 30;
    double scale_ = 1.0;
    bool bitrate_dirty_ = false;
    bool force_keyframe_ = false;

    uint64_t frame_count_ = 0;
    bool have_last_ts_ = false;
    uint64_t last_ts_us_ = 0;

    // Full-size and scaled I420 planes
    std::vector<uint8_t> i420_full_;
    std::vector<uint8_t> i420_scaled_;
};

} // namespace media

#endif // VP8_ENCODER_H
