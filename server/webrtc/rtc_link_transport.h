/*
 * libdatachannel Link Transport
 *
 * RtcLinkTransport wraps one rtc::PeerConnection:
 * - the "control" data channel (reliable, ordered)
 * - send-only VP8 + Opus tracks with a per-link encoder pair (host)
 * - receive-only video/audio tracks (controller)
 * - RTCP statistics observers feeding read_counters()
 *
 * Auto-negotiation is off; descriptions are only generated when the
 * manager asks for an offer or an answer.
 */

#ifndef RTC_LINK_TRANSPORT_H
#define RTC_LINK_TRANSPORT_H

#include "link_transport.h"
#include "rtcp_stats.h"
#include "../media/opus_encoder.h"
#include "../media/vp8_encoder.h"
#include "../protocol/control_dispatcher.h"
#include <rtc/rtc.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace webrtc {

class RtcControlChannel : public ControlChannel {
public:
    RtcControlChannel(std::shared_ptr<rtc::DataChannel> channel, bool debug);
    ~RtcControlChannel() override;

    std::string label() const override;
    bool is_open() const override;
    bool send(const std::string& text) override;
    void close() override;
    size_t buffered_amount() const override;

    void on_open(OpenCallback callback) override;
    void on_message(MessageCallback callback) override;
    void on_closed(ClosedCallback callback) override;

private:
    std::shared_ptr<rtc::DataChannel> channel_;
    bool debug_;
};

class RtcLinkTransport : public LinkTransport {
public:
    RtcLinkTransport(const std::string& remote_id, protocol::Role local_role,
                     const rtc::Configuration& config, bool debug);
    ~RtcLinkTransport() override;

    std::optional<SessionDescription> create_offer() override;
    std::optional<SessionDescription> create_answer() override;
    void set_remote_description(const SessionDescription& description) override;
    void add_remote_candidate(const IceCandidate& candidate) override;

    bool has_remote_description() const override;
    SignalingState signaling_state() const override;
    LinkState state() const override;

    std::shared_ptr<ControlChannel> create_control_channel(const std::string& label) override;

    bool attach_outgoing_media() override;
    void detach_outgoing_media() override;
    bool has_outgoing_media() const override;

    bool send_video_frame(const uint8_t* bgra, int width, int height, int stride,
                          uint64_t timestamp_us) override;
    bool send_audio_samples(const int16_t* pcm, int frame_size) override;

    std::optional<quality::TransportCounters> read_counters() override;
    bool apply_encoding(const quality::EncodingLimits& limits) override;

    void close() override;

    void on_local_candidate(CandidateCallback callback) override;
    void on_state_change(StateCallback callback) override;
    void on_control_channel(ChannelCallback callback) override;
    void on_track(TrackCallback callback) override;

private:
    std::optional<SessionDescription> make_local_description(rtc::Description::Type type);
    void add_receive_tracks();
    void send_vp8_rtp(const std::vector<uint8_t>& frame, uint64_t timestamp_us);

    std::string remote_id_;
    protocol::Role role_;
    bool debug_;
    std::shared_ptr<rtc::PeerConnection> pc_;

    // Receive side (controller)
    std::shared_ptr<rtc::Track> recv_video_;
    std::shared_ptr<rtc::Track> recv_audio_;
    std::shared_ptr<RtcpStatsObserver> recv_video_stats_;
    std::shared_ptr<RtcpStatsObserver> recv_audio_stats_;

    // Send side (host). media_mutex_ guards everything below: capture
    // threads encode and send while the loop thread applies limits.
    mutable std::mutex media_mutex_;
    std::shared_ptr<rtc::Track> video_track_;
    std::shared_ptr<rtc::Track> audio_track_;
    std::shared_ptr<RtcpStatsObserver> video_stats_;
    std::shared_ptr<RtcpStatsObserver> audio_stats_;
    media::VP8Encoder vp8_;
    media::OpusAudioEncoder opus_;
    quality::EncodingLimits limits_;
    bool have_limits_ = false;
    uint32_t video_ssrc_;
    uint32_t audio_ssrc_;
    uint16_t seq_num_ = 0;
    uint16_t picture_id_ = 0;
    uint64_t audio_frames_ = 0;
};

class RtcTransportFactory : public TransportFactory {
public:
    RtcTransportFactory(std::vector<std::string> ice_servers, protocol::Role local_role, bool debug);

    std::unique_ptr<LinkTransport> create(const std::string& remote_id, bool offerer) override;

private:
    std::vector<std::string> ice_servers_;
    protocol::Role role_;
    bool debug_;
};

} // namespace webrtc

#endif // RTC_LINK_TRANSPORT_H
