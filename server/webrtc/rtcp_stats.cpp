/*
 * RTP/RTCP Statistics Observer Implementation
 */

#include "rtcp_stats.h"

namespace webrtc {

namespace {

constexpr uint8_t RTCP_SR = 200;
constexpr uint8_t RTCP_RR = 201;
constexpr size_t RTP_HEADER_SIZE = 12;
constexpr size_t REPORT_BLOCK_SIZE = 24;

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t read_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

} // namespace

RtcpStatsObserver::RtcpStatsObserver(Direction direction, uint32_t ssrc, uint32_t clock_rate)
    : direction_(direction)
    , ssrc_(ssrc)
    , clock_rate_(clock_rate > 0 ? clock_rate : 90000)
    , epoch_(std::chrono::steady_clock::now())
{}

bool RtcpStatsObserver::is_rtcp(const uint8_t* data, size_t size) {
    // RFC 5761 demultiplexing: RTCP packet types occupy 192-223
    return size >= 4 && (data[0] >> 6) == 2 && data[1] >= 192 && data[1] <= 223;
}

void RtcpStatsObserver::incoming(rtc::message_vector& messages, const rtc::message_callback& send) {
    (void)send;
    auto now = std::chrono::steady_clock::now();
    for (const auto& message : messages) {
        if (!message || message->empty()) continue;
        const uint8_t* data = reinterpret_cast<const uint8_t*>(message->data());
        size_t size = message->size();
        if (is_rtcp(data, size)) {
            observe_rtcp(data, size);
        } else if (direction_ == Direction::Receive) {
            observe_incoming_rtp(data, size, now);
        }
    }
}

void RtcpStatsObserver::outgoing(rtc::message_vector& messages, const rtc::message_callback& send) {
    (void)send;
    if (direction_ != Direction::Send) return;
    for (const auto& message : messages) {
        if (!message || message->empty()) continue;
        const uint8_t* data = reinterpret_cast<const uint8_t*>(message->data());
        size_t size = message->size();
        if (!is_rtcp(data, size)) {
            observe_outgoing_rtp(data, size);
        }
    }
}

void RtcpStatsObserver::observe_outgoing_rtp(const uint8_t* data, size_t size) {
    if (size < RTP_HEADER_SIZE || read_u32(data + 8) != ssrc_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!have_first_seq_) {
        first_seq_ = read_u16(data + 2);
        have_first_seq_ = true;
    }
    stats_.packets_sent++;
}

void RtcpStatsObserver::observe_rtcp(const uint8_t* data, size_t size) {
    size_t offset = 0;
    std::lock_guard<std::mutex> lock(mutex_);

    // Walk the compound packet
    while (offset + 4 <= size) {
        const uint8_t* packet = data + offset;
        uint8_t count = packet[0] & 0x1F;
        uint8_t type = packet[1];
        size_t length = (static_cast<size_t>(read_u16(packet + 2)) + 1) * 4;
        if (offset + length > size) break;

        size_t blocks = 0;
        if (type == RTCP_SR) {
            blocks = 28;    // header + sender SSRC + sender info
        } else if (type == RTCP_RR) {
            blocks = 8;     // header + sender SSRC
        }

        if (blocks != 0 && direction_ == Direction::Send) {
            for (uint8_t i = 0; i < count; i++) {
                size_t at = blocks + i * REPORT_BLOCK_SIZE;
                if (at + REPORT_BLOCK_SIZE > length) break;
                read_report_block(packet + at);
            }
        }
        offset += length;
    }
}

void RtcpStatsObserver::read_report_block(const uint8_t* block) {
    if (read_u32(block) != ssrc_) return;

    // Cumulative lost is a signed 24-bit value
    int32_t lost = static_cast<int32_t>((block[5] << 16) | (block[6] << 8) | block[7]);
    if (lost & 0x800000) lost -= 0x1000000;
    uint32_t highest_seq = read_u32(block + 8);
    uint32_t jitter = read_u32(block + 12);

    uint64_t packets_lost = lost > 0 ? static_cast<uint64_t>(lost) : 0;
    uint64_t expected = 0;
    if (have_first_seq_ && highest_seq >= first_seq_) {
        expected = static_cast<uint64_t>(highest_seq - first_seq_) + 1;
    }

    stats_.has_data = true;
    stats_.packets_lost = packets_lost;
    stats_.packets_received = expected > packets_lost ? expected - packets_lost : 0;
    stats_.jitter_ms = static_cast<double>(jitter) * 1000.0 / clock_rate_;
}

void RtcpStatsObserver::observe_incoming_rtp(const uint8_t* data, size_t size,
                                             std::chrono::steady_clock::time_point arrival) {
    if (size < RTP_HEADER_SIZE || (data[0] >> 6) != 2) return;

    uint16_t seq = read_u16(data + 2);
    uint32_t rtp_timestamp = read_u32(data + 4);

    std::lock_guard<std::mutex> lock(mutex_);

    if (!have_base_seq_) {
        have_base_seq_ = true;
        base_seq_ = seq;
        max_ext_seq_ = seq;
    } else {
        uint16_t max_seq = static_cast<uint16_t>(max_ext_seq_ & 0xFFFF);
        int16_t delta = static_cast<int16_t>(seq - max_seq);
        if (delta > 0) {
            if (seq < max_seq) {
                cycles_ += 65536;   // sequence number wrapped
            }
            max_ext_seq_ = cycles_ + seq;
        }
    }

    stats_.has_data = true;
    stats_.packets_received++;
    uint64_t expected = static_cast<uint64_t>(max_ext_seq_ - base_seq_) + 1;
    stats_.packets_lost = expected > stats_.packets_received ? expected - stats_.packets_received : 0;

    // Interarrival jitter in timestamp units
    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(arrival - epoch_).count();
    int64_t arrival_units = static_cast<int64_t>(elapsed_us * static_cast<double>(clock_rate_) / 1000000.0);
    uint32_t transit = static_cast<uint32_t>(arrival_units) - rtp_timestamp;
    if (have_transit_) {
        int64_t d = static_cast<int32_t>(transit - last_transit_);
        if (d < 0) d = -d;
        jitter_units_ += (static_cast<double>(d) - jitter_units_) / 16.0;
    }
    last_transit_ = transit;
    have_transit_ = true;
    stats_.jitter_ms = jitter_units_ * 1000.0 / clock_rate_;
}

RtpStreamStats RtcpStatsObserver::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace webrtc
