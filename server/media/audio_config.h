/*
 * Audio Configuration
 *
 * Format of the PCM the host pushes into the link encoders and the fixed
 * Opus settings. The Opus bitrate itself comes from the active quality
 * preset.
 */

#ifndef AUDIO_CONFIG_H
#define AUDIO_CONFIG_H

// ============================================================================
// Core Audio Format
// ============================================================================

// Sample rate (Hz) - 48kHz is the WebRTC/Opus standard
#define AUDIO_SAMPLE_RATE       48000

// Number of channels (1 = mono, 2 = stereo)
#define AUDIO_CHANNELS          2

// Frame duration in milliseconds (Opus supports 2.5, 5, 10, 20, 40, 60)
#define AUDIO_FRAME_DURATION_MS 20

// Samples per channel in one frame: 48000 * 20 / 1000 = 960
#define AUDIO_FRAME_SIZE        ((AUDIO_SAMPLE_RATE * AUDIO_FRAME_DURATION_MS) / 1000)

// ============================================================================
// Opus Encoder Settings
// ============================================================================

// Starting bitrate until a preset is applied (bits per second)
#define OPUS_DEFAULT_BITRATE    96000

// Complexity (0-10); 5 keeps per-link encoding cheap with several links
#define OPUS_COMPLEXITY         5

#define OPUS_SIGNAL_TYPE        OPUS_SIGNAL_MUSIC

// Forward Error Correction for packet loss (1 = enabled)
#define OPUS_INBAND_FEC         1

// Expected packet loss percentage, tunes FEC
#define OPUS_PACKET_LOSS_PERC   2

// ============================================================================
// WebRTC Profile Settings
// ============================================================================

#define OPUS_PAYLOAD_TYPE       111

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

// "minptime=20;stereo=1;sprop-stereo=1;useinbandfec=1"
#define WEBRTC_OPUS_PROFILE \
    "minptime=" TOSTRING(AUDIO_FRAME_DURATION_MS) \
    ";stereo=1;sprop-stereo=1" \
    ";useinbandfec=" TOSTRING(OPUS_INBAND_FEC)

// ============================================================================
// Video
// ============================================================================

#define VP8_PAYLOAD_TYPE        96

// RTP clock for video
#define VIDEO_CLOCK_RATE        90000

#endif // AUDIO_CONFIG_H
