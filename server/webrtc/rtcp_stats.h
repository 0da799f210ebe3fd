/*
 * RTP/RTCP Statistics Observer
 *
 * A pass-through rtc::MediaHandler chained onto a track. It never alters
 * messages; it only counts what goes by.
 *
 * Sending track: counts outgoing RTP for our SSRC and reads loss and
 * jitter for that SSRC out of the remote side's RTCP SR/RR report blocks.
 *
 * Receiving track: counts incoming RTP, derives loss from sequence gaps
 * and interarrival jitter per RFC 3550 section 6.4.1.
 */

#ifndef RTCP_STATS_H
#define RTCP_STATS_H

#include <rtc/rtc.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace webrtc {

struct RtpStreamStats {
    bool has_data = false;          // any report (sender) or packet (receiver) seen
    uint64_t packets_sent = 0;
    uint64_t packets_received = 0;
    uint64_t packets_lost = 0;
    double jitter_ms = 0.0;
};

class RtcpStatsObserver : public rtc::MediaHandler {
public:
    enum class Direction {
        Send,
        Receive
    };

    // ssrc: our outgoing SSRC (Send); ignored for Receive
    RtcpStatsObserver(Direction direction, uint32_t ssrc, uint32_t clock_rate);

    void incoming(rtc::message_vector& messages, const rtc::message_callback& send) override;
    void outgoing(rtc::message_vector& messages, const rtc::message_callback& send) override;

    RtpStreamStats stats() const;

    // Parsing entry points, usable without a track
    void observe_rtcp(const uint8_t* data, size_t size);
    void observe_incoming_rtp(const uint8_t* data, size_t size, std::chrono::steady_clock::time_point arrival);
    void observe_outgoing_rtp(const uint8_t* data, size_t size);

    static bool is_rtcp(const uint8_t* data, size_t size);

private:
    void read_report_block(const uint8_t* block);

    Direction direction_;
    uint32_t ssrc_;
    uint32_t clock_rate_;

    mutable std::mutex mutex_;
    RtpStreamStats stats_;

    // Send direction
    bool have_first_seq_ = false;
    uint16_t first_seq_ = 0;

    // Receive direction
    bool have_base_seq_ = false;
    uint32_t base_seq_ = 0;
    uint32_t max_ext_seq_ = 0;
    uint32_t cycles_ = 0;
    bool have_transit_ = false;
    uint32_t last_transit_ = 0;
    double jitter_units_ = 0.0;
    std::chrono::steady_clock::time_point epoch_;
};

} // namespace webrtc

#endif // RTCP_STATS_H
