/*
 * VP8 Encoder Implementation
 */

#include "vp8_encoder.h"
#include <libyuv.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace media {

void VP8Encoder::scaled_size(int width, int height, double scale, int& out_width, int& out_height) {
    if (scale < 1.0) scale = 1.0;
    out_width = static_cast<int>(std::lround(width / scale)) & ~1;
    out_height = static_cast<int>(std::lround(height / scale)) & ~1;
    out_width = std::max(2, out_width);
    out_height = std::max(2, out_height);
}

void VP8Encoder::set_limits(uint32_t bitrate_bps, int max_framerate, double scale_down_factor) {
    if (bitrate_bps != bitrate_bps_) {
        bitrate_bps_ = bitrate_bps;
        bitrate_dirty_ = true;
    }
    max_fps_ = max_framerate;
    scale_ = std::max(1.0, scale_down_factor);
}

bool VP8Encoder::init(int width, int height) {
    cleanup();

    vpx_codec_iface_t* iface = vpx_codec_vp8_cx();
    vpx_codec_err_t res = vpx_codec_enc_config_default(iface, &config_, 0);
    if (res != VPX_CODEC_OK) {
        fprintf(stderr, "[VP8] Failed to get default config (error %d)\n", res);
        return false;
    }

    int fps = max_fps_ > 0 ? max_fps_ : 30;

    config_.g_w = width;
    config_.g_h = height;
    config_.g_timebase.num = 1;
    config_.g_timebase.den = 1000000;   // microsecond pts
    config_.rc_target_bitrate = std::max(1u, bitrate_bps_ / 1000);
    config_.g_error_resilient = VPX_ERROR_RESILIENT_DEFAULT;
    config_.g_lag_in_frames = 0;        // Realtime
    config_.rc_end_usage = VPX_CBR;
    config_.rc_min_quantizer = 4;
    config_.rc_max_quantizer = 56;
    config_.rc_buf_sz = 1000;
    config_.rc_buf_initial_sz = 500;
    config_.rc_buf_optimal_sz = 600;
    config_.kf_mode = VPX_KF_AUTO;
    config_.kf_max_dist = fps * 5;
    config_.g_threads = 2;

    res = vpx_codec_enc_init(&codec_, iface, &config_, 0);
    if (res != VPX_CODEC_OK) {
        fprintf(stderr, "[VP8] Failed to initialize encoder (error %d: %s)\n",
                res, vpx_codec_error_detail(&codec_));
        return false;
    }

    // Realtime settings
    vpx_codec_control(&codec_, VP8E_SET_CPUUSED, 8);
    vpx_codec_control(&codec_, VP8E_SET_NOISE_SENSITIVITY, 0);
    vpx_codec_control(&codec_, VP8E_SET_TOKEN_PARTITIONS, 0);  // Single partition for simpler RTP
    vpx_codec_control(&codec_, VP8E_SET_SCREEN_CONTENT_MODE, 1);

    width_ = width;
    height_ = height;
    frame_count_ = 0;
    bitrate_dirty_ = false;
    force_keyframe_ = true;
    initialized_ = true;

    fprintf(stderr, "[VP8] Encoder initialized %dx%d @ %u kbps\n",
            width, height, config_.rc_target_bitrate);
    return true;
}

void VP8Encoder::cleanup() {
    if (initialized_) {
        vpx_codec_destroy(&codec_);
        initialized_ = false;
    }
}

bool VP8Encoder::apply_bitrate() {
    config_.rc_target_bitrate = std::max(1u, bitrate_bps_ / 1000);
    vpx_codec_err_t res = vpx_codec_enc_config_set(&codec_, &config_);
    if (res != VPX_CODEC_OK) {
        fprintf(stderr, "[VP8] Failed to set bitrate %u kbps: %s\n",
                config_.rc_target_bitrate, vpx_codec_error_detail(&codec_));
        return false;
    }
    bitrate_dirty_ = false;
    return true;
}

bool VP8Encoder::encode_bgra(const uint8_t* bgra, int width, int height, int stride,
                             uint64_t timestamp_us, EncodedFrame& out) {
    if (!bgra || width < 2 || height < 2) {
        return false;
    }

    // Frame-rate cap, with 10% slack for capture timer jitter
    if (max_fps_ > 0 && have_last_ts_ && timestamp_us > last_ts_us_) {
        uint64_t min_gap_us = static_cast<uint64_t>(900000.0 / max_fps_);
        if (timestamp_us - last_ts_us_ < min_gap_us) {
            return false;
        }
    }

    int out_w = 0;
    int out_h = 0;
    scaled_size(width, height, scale_, out_w, out_h);

    if (!initialized_ || out_w != width_ || out_h != height_) {
        if (!init(out_w, out_h)) {
            return false;
        }
    } else if (bitrate_dirty_) {
        apply_bitrate();
    }

    // Even-size source for the I420 conversion
    int src_w = width & ~1;
    int src_h = height & ~1;
    int half_w = src_w / 2;
    int half_h = src_h / 2;
    i420_full_.resize(static_cast<size_t>(src_w) * src_h + 2 * static_cast<size_t>(half_w) * half_h);
    uint8_t* fy = i420_full_.data();
    uint8_t* fu = fy + static_cast<size_t>(src_w) * src_h;
    uint8_t* fv = fu + static_cast<size_t>(half_w) * half_h;

    // libyuv "ARGB" is B,G,R,A in memory
    if (libyuv::ARGBToI420(bgra, stride, fy, src_w, fu, half_w, fv, half_w, src_w, src_h) != 0) {
        fprintf(stderr, "[VP8] BGRA to I420 conversion failed\n");
        return false;
    }

    uint8_t* y = fy;
    uint8_t* u = fu;
    uint8_t* v = fv;
    if (out_w != src_w || out_h != src_h) {
        int out_half_w = out_w / 2;
        int out_half_h = out_h / 2;
        i420_scaled_.resize(static_cast<size_t>(out_w) * out_h + 2 * static_cast<size_t>(out_half_w) * out_half_h);
        y = i420_scaled_.data();
        u = y + static_cast<size_t>(out_w) * out_h;
        v = u + static_cast<size_t>(out_half_w) * out_half_h;
        libyuv::I420Scale(fy, src_w, fu, half_w, fv, half_w, src_w, src_h,
                          y, out_w, u, out_half_w, v, out_half_w, out_w, out_h,
                          libyuv::kFilterBox);
    }

    vpx_image_t img;
    memset(&img, 0, sizeof(img));
    vpx_img_wrap(&img, VPX_IMG_FMT_I420, out_w, out_h, 1, y);
    img.planes[VPX_PLANE_Y] = y;
    img.planes[VPX_PLANE_U] = u;
    img.planes[VPX_PLANE_V] = v;
    img.stride[VPX_PLANE_Y] = out_w;
    img.stride[VPX_PLANE_U] = out_w / 2;
    img.stride[VPX_PLANE_V] = out_w / 2;

    vpx_enc_frame_flags_t flags = 0;
    if (force_keyframe_) {
        flags |= VPX_EFLAG_FORCE_KF;
        force_keyframe_ = false;
    }

    vpx_codec_pts_t pts = static_cast<vpx_codec_pts_t>(timestamp_us);
    unsigned long duration = max_fps_ > 0 ? 1000000 / max_fps_ : 33333;
    vpx_codec_err_t res = vpx_codec_encode(&codec_, &img, pts, duration, flags, VPX_DL_REALTIME);
    if (res != VPX_CODEC_OK) {
        fprintf(stderr, "[VP8] Encode failed: %s\n", vpx_codec_error_detail(&codec_));
        return false;
    }

    frame_count_++;
    have_last_ts_ = true;
    last_ts_us_ = timestamp_us;

    out.data.clear();
    out.is_keyframe = false;
    vpx_codec_iter_t iter = nullptr;
    const vpx_codec_cx_pkt_t* pkt;
    while ((pkt = vpx_codec_get_cx_data(&codec_, &iter)) != nullptr) {
        if (pkt->kind == VPX_CODEC_CX_FRAME_PKT) {
            const uint8_t* data = static_cast<const uint8_t*>(pkt->data.frame.buf);
            out.data.insert(out.data.end(), data, data + pkt->data.frame.sz);
            if (pkt->data.frame.flags & VPX_FRAME_IS_KEY) {
                out.is_keyframe = true;
            }
        }
    }

    out.width = out_w;
    out.height = out_h;
    out.timestamp_us = timestamp_us;
    return !out.data.empty();
}

} // namespace media
