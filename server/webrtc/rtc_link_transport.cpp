/*
 * libdatachannel Link Transport Implementation
 */

#include "rtc_link_transport.h"
#include "../media/audio_config.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <random>
#include <stdexcept>

namespace webrtc {

namespace {

const int RTP_HEADER_SIZE = 12;
const int VP8_DESC_SIZE = 4;
const int MAX_PAYLOAD = 1200;  // Safe MTU

uint32_t random_ssrc() {
    static std::mt19937 rng{std::random_device{}()};
    return std::uniform_int_distribution<uint32_t>(1, 0x7FFFFFFF)(rng);
}

LinkState to_link_state(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return LinkState::New;
        case rtc::PeerConnection::State::Connecting: return LinkState::Connecting;
        case rtc::PeerConnection::State::Connected: return LinkState::Connected;
        case rtc::PeerConnection::State::Disconnected: return LinkState::Disconnected;
        case rtc::PeerConnection::State::Failed: return LinkState::Failed;
        case rtc::PeerConnection::State::Closed: return LinkState::Closed;
    }
    return LinkState::Closed;
}

void accumulate(const RtpStreamStats& stream, quality::TransportCounters& counters) {
    counters.packets_received += stream.packets_received;
    counters.packets_lost += stream.packets_lost;
    counters.jitter_ms = std::max(counters.jitter_ms, stream.jitter_ms);
}

} // namespace

// ============================================================================
// Control channel
// ============================================================================

RtcControlChannel::RtcControlChannel(std::shared_ptr<rtc::DataChannel> channel, bool debug)
    : channel_(std::move(channel))
    , debug_(debug)
{}

RtcControlChannel::~RtcControlChannel() {
    channel_->resetCallbacks();
}

std::string RtcControlChannel::label() const {
    return channel_->label();
}

bool RtcControlChannel::is_open() const {
    return channel_->isOpen();
}

bool RtcControlChannel::send(const std::string& text) {
    if (!channel_->isOpen()) {
        return false;
    }
    try {
        // false from libdatachannel only means the frame was buffered
        if (!channel_->send(text) && debug_) {
            fprintf(stderr, "[WebRTC] Control frame buffered (%zu bytes waiting)\n",
                    channel_->bufferedAmount());
        }
        return true;
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Control channel send failed: %s\n", e.what());
        return false;
    }
}

size_t RtcControlChannel::buffered_amount() const {
    return channel_->bufferedAmount();
}

void RtcControlChannel::close() {
    try {
        channel_->close();
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Control channel close failed: %s\n", e.what());
    }
}

void RtcControlChannel::on_open(OpenCallback callback) {
    channel_->onOpen(std::move(callback));
}

void RtcControlChannel::on_message(MessageCallback callback) {
    bool debug = debug_;
    channel_->onMessage([callback, debug](rtc::message_variant data) {
        if (std::holds_alternative<std::string>(data)) {
            callback(std::get<std::string>(data));
        } else if (debug) {
            fprintf(stderr, "[WebRTC] Ignoring binary control frame (%zu bytes)\n",
                    std::get<rtc::binary>(data).size());
        }
    });
}

void RtcControlChannel::on_closed(ClosedCallback callback) {
    channel_->onClosed(std::move(callback));
}

// ============================================================================
// Peer connection
// ============================================================================

RtcLinkTransport::RtcLinkTransport(const std::string& remote_id, protocol::Role local_role,
                                   const rtc::Configuration& config, bool debug)
    : remote_id_(remote_id)
    , role_(local_role)
    , debug_(debug)
    , pc_(std::make_shared<rtc::PeerConnection>(config))
    , video_ssrc_(random_ssrc())
    , audio_ssrc_(random_ssrc())
{
    if (role_ == protocol::Role::Controller) {
        add_receive_tracks();
    }
}

RtcLinkTransport::~RtcLinkTransport() {
    close();
}

void RtcLinkTransport::add_receive_tracks() {
    // Offer m-lines so the host can answer with its send-only tracks
    rtc::Description::Video video("video", rtc::Description::Direction::RecvOnly);
    video.addVP8Codec(VP8_PAYLOAD_TYPE);
    recv_video_ = pc_->addTrack(video);

    auto video_session = std::make_shared<rtc::RtcpReceivingSession>();
    recv_video_stats_ = std::make_shared<RtcpStatsObserver>(
        RtcpStatsObserver::Direction::Receive, 0, VIDEO_CLOCK_RATE);
    video_session->addToChain(recv_video_stats_);
    recv_video_->setMediaHandler(video_session);

    rtc::Description::Audio audio("audio", rtc::Description::Direction::RecvOnly);
    audio.addOpusCodec(OPUS_PAYLOAD_TYPE, WEBRTC_OPUS_PROFILE);
    recv_audio_ = pc_->addTrack(audio);

    auto audio_session = std::make_shared<rtc::RtcpReceivingSession>();
    recv_audio_stats_ = std::make_shared<RtcpStatsObserver>(
        RtcpStatsObserver::Direction::Receive, 0, AUDIO_SAMPLE_RATE);
    audio_session->addToChain(recv_audio_stats_);
    recv_audio_->setMediaHandler(audio_session);
}

std::optional<SessionDescription> RtcLinkTransport::make_local_description(rtc::Description::Type type) {
    try {
        pc_->setLocalDescription(type);
        auto description = pc_->localDescription();
        if (!description) {
            fprintf(stderr, "[WebRTC] No local description for %s\n", remote_id_.c_str());
            return std::nullopt;
        }
        return SessionDescription{description->typeString(), std::string(*description)};
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Failed to create local description for %s: %s\n",
                remote_id_.c_str(), e.what());
        return std::nullopt;
    }
}

std::optional<SessionDescription> RtcLinkTransport::create_offer() {
    return make_local_description(rtc::Description::Type::Offer);
}

std::optional<SessionDescription> RtcLinkTransport::create_answer() {
    return make_local_description(rtc::Description::Type::Answer);
}

void RtcLinkTransport::set_remote_description(const SessionDescription& description) {
    pc_->setRemoteDescription(rtc::Description(description.sdp, description.type));
}

void RtcLinkTransport::add_remote_candidate(const IceCandidate& candidate) {
    pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.mid));
}

bool RtcLinkTransport::has_remote_description() const {
    return pc_->remoteDescription().has_value();
}

SignalingState RtcLinkTransport::signaling_state() const {
    switch (pc_->signalingState()) {
        case rtc::PeerConnection::SignalingState::HaveLocalOffer:
            return SignalingState::HaveLocalOffer;
        case rtc::PeerConnection::SignalingState::HaveRemoteOffer:
            return SignalingState::HaveRemoteOffer;
        default:
            return SignalingState::Stable;
    }
}

LinkState RtcLinkTransport::state() const {
    return to_link_state(pc_->state());
}

std::shared_ptr<ControlChannel> RtcLinkTransport::create_control_channel(const std::string& label) {
    rtc::DataChannelInit init;   // reliable and ordered by default
    auto channel = pc_->createDataChannel(label, init);
    return std::make_shared<RtcControlChannel>(channel, debug_);
}

bool RtcLinkTransport::attach_outgoing_media() {
    std::lock_guard<std::mutex> lock(media_mutex_);
    if (video_track_) {
        return true;
    }

    try {
        // Video: VP8, packetized by send_vp8_rtp
        rtc::Description::Video video("video", rtc::Description::Direction::SendOnly);
        video.addVP8Codec(VP8_PAYLOAD_TYPE);
        video.addSSRC(video_ssrc_, "video", "desklink", "video");
        video_track_ = pc_->addTrack(video);

        auto video_nack = std::make_shared<rtc::RtcpNackResponder>();
        video_stats_ = std::make_shared<RtcpStatsObserver>(
            RtcpStatsObserver::Direction::Send, video_ssrc_, VIDEO_CLOCK_RATE);
        video_nack->addToChain(video_stats_);
        video_track_->setMediaHandler(video_nack);

        std::string remote_id = remote_id_;
        video_track_->onOpen([this, remote_id]() {
            if (debug_) {
                fprintf(stderr, "[WebRTC] Video track OPEN for %s\n", remote_id.c_str());
            }
            std::lock_guard<std::mutex> media_lock(media_mutex_);
            vp8_.request_keyframe();
        });

        // Audio: Opus with SR reports and NACK handling
        rtc::Description::Audio audio("audio", rtc::Description::Direction::SendOnly);
        audio.addOpusCodec(OPUS_PAYLOAD_TYPE, WEBRTC_OPUS_PROFILE);
        audio.addSSRC(audio_ssrc_, "audio", "desklink", "audio");
        audio_track_ = pc_->addTrack(audio);

        auto rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(
            audio_ssrc_, "audio", OPUS_PAYLOAD_TYPE, rtc::OpusRtpPacketizer::defaultClockRate);
        auto packetizer = std::make_shared<rtc::OpusRtpPacketizer>(rtp_config);
        packetizer->addToChain(std::make_shared<rtc::RtcpSrReporter>(rtp_config));
        packetizer->addToChain(std::make_shared<rtc::RtcpNackResponder>());
        audio_stats_ = std::make_shared<RtcpStatsObserver>(
            RtcpStatsObserver::Direction::Send, audio_ssrc_, AUDIO_SAMPLE_RATE);
        packetizer->addToChain(audio_stats_);
        audio_track_->setMediaHandler(packetizer);
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Failed to add media tracks for %s: %s\n", remote_id_.c_str(), e.what());
        video_track_.reset();
        audio_track_.reset();
        video_stats_.reset();
        audio_stats_.reset();
        return false;
    }

    int audio_bitrate = have_limits_ ? static_cast<int>(limits_.audio.max_bitrate_bps) : OPUS_DEFAULT_BITRATE;
    if (!opus_.init(AUDIO_SAMPLE_RATE, AUDIO_CHANNELS, audio_bitrate)) {
        fprintf(stderr, "[WebRTC] Opus encoder unavailable for %s; audio disabled\n", remote_id_.c_str());
    }
    if (have_limits_) {
        vp8_.set_limits(limits_.video.max_bitrate_bps, limits_.video.max_framerate,
                        limits_.video.scale_down_factor);
    }
    seq_num_ = static_cast<uint16_t>(random_ssrc());
    audio_frames_ = 0;

    if (debug_) {
        fprintf(stderr, "[WebRTC] Outgoing media attached for %s (video ssrc=%u audio ssrc=%u)\n",
                remote_id_.c_str(), video_ssrc_, audio_ssrc_);
    }
    return true;
}

void RtcLinkTransport::detach_outgoing_media() {
    std::lock_guard<std::mutex> lock(media_mutex_);
    for (auto* track : {&video_track_, &audio_track_}) {
        if (*track) {
            try {
                (*track)->resetCallbacks();
                (*track)->close();
            } catch (const std::exception& e) {
                fprintf(stderr, "[WebRTC] Track close failed for %s: %s\n", remote_id_.c_str(), e.what());
            }
            track->reset();
        }
    }
    video_stats_.reset();
    audio_stats_.reset();
    vp8_.cleanup();
    opus_.cleanup();
}

bool RtcLinkTransport::has_outgoing_media() const {
    std::lock_guard<std::mutex> lock(media_mutex_);
    return video_track_ != nullptr;
}

bool RtcLinkTransport::send_video_frame(const uint8_t* bgra, int width, int height, int stride,
                                        uint64_t timestamp_us) {
    std::lock_guard<std::mutex> lock(media_mutex_);
    if (!video_track_ || !video_track_->isOpen()) {
        return false;
    }

    media::EncodedFrame frame;
    if (!vp8_.encode_bgra(bgra, width, height, stride, timestamp_us, frame)) {
        return false;   // dropped by the frame-rate cap, or encoder error (logged)
    }
    send_vp8_rtp(frame.data, timestamp_us);
    return true;
}

void RtcLinkTransport::send_vp8_rtp(const std::vector<uint8_t>& data, uint64_t timestamp_us) {
    // RTP header (12 bytes) + VP8 payload descriptor per RFC 7741 (4 bytes with PictureID)
    uint32_t timestamp = static_cast<uint32_t>(timestamp_us * VIDEO_CLOCK_RATE / 1000000);
    picture_id_ = (picture_id_ + 1) & 0x7FFF;

    size_t offset = 0;
    bool first = true;

    while (offset < data.size()) {
        size_t chunk_size = std::min(data.size() - offset, (size_t)(MAX_PAYLOAD - VP8_DESC_SIZE));
        bool last = (offset + chunk_size >= data.size());

        std::vector<uint8_t> packet(RTP_HEADER_SIZE + VP8_DESC_SIZE + chunk_size);

        packet[0] = 0x80;  // Version 2
        packet[1] = VP8_PAYLOAD_TYPE | (last ? 0x80 : 0);  // marker on the last packet
        packet[2] = (seq_num_ >> 8) & 0xFF;
        packet[3] = seq_num_ & 0xFF;
        packet[4] = (timestamp >> 24) & 0xFF;
        packet[5] = (timestamp >> 16) & 0xFF;
        packet[6] = (timestamp >> 8) & 0xFF;
        packet[7] = timestamp & 0xFF;
        packet[8] = (video_ssrc_ >> 24) & 0xFF;
        packet[9] = (video_ssrc_ >> 16) & 0xFF;
        packet[10] = (video_ssrc_ >> 8) & 0xFF;
        packet[11] = video_ssrc_ & 0xFF;

        // |X|R|N|S|R| PID |  X=1, S=1 on the first packet of the frame
        packet[12] = 0x80 | (first ? 0x10 : 0x00);
        // |I|L|T|K| RSV   |  I=1
        packet[13] = 0x80;
        // |M| PictureID   |  M=1 for a 15-bit PictureID
        packet[14] = 0x80 | ((picture_id_ >> 8) & 0x7F);
        packet[15] = picture_id_ & 0xFF;

        memcpy(&packet[RTP_HEADER_SIZE + VP8_DESC_SIZE], &data[offset], chunk_size);

        try {
            video_track_->send(reinterpret_cast<const std::byte*>(packet.data()), packet.size());
        } catch (const std::exception& e) {
            fprintf(stderr, "[WebRTC] Video send error to %s: %s\n", remote_id_.c_str(), e.what());
            return;
        }

        seq_num_++;
        offset += chunk_size;
        first = false;
    }
}

bool RtcLinkTransport::send_audio_samples(const int16_t* pcm, int frame_size) {
    std::lock_guard<std::mutex> lock(media_mutex_);
    if (!audio_track_ || !audio_track_->isOpen() || !opus_.is_initialized()) {
        return false;
    }

    std::vector<uint8_t> opus_data = opus_.encode(pcm, frame_size);
    if (opus_data.empty()) {
        return false;
    }

    // Sample time from the frame count; the SR reporter maps it onto the 48kHz RTP clock
    auto elapsed = std::chrono::duration<double>(audio_frames_ * (AUDIO_FRAME_DURATION_MS / 1000.0));
    audio_frames_++;

    try {
        audio_track_->sendFrame(reinterpret_cast<const std::byte*>(opus_data.data()),
                                opus_data.size(), rtc::FrameInfo(elapsed));
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Audio send error to %s: %s\n", remote_id_.c_str(), e.what());
        return false;
    }
    return true;
}

std::optional<quality::TransportCounters> RtcLinkTransport::read_counters() {
    quality::TransportCounters counters;
    bool have_media = false;

    {
        std::lock_guard<std::mutex> lock(media_mutex_);
        for (const auto& observer : {video_stats_, audio_stats_}) {
            if (!observer) continue;
            RtpStreamStats stream = observer->stats();
            if (stream.has_data) {
                accumulate(stream, counters);
                have_media = true;
            }
        }
    }
    for (const auto& observer : {recv_video_stats_, recv_audio_stats_}) {
        if (!observer) continue;
        RtpStreamStats stream = observer->stats();
        if (stream.has_data) {
            accumulate(stream, counters);
            have_media = true;
        }
    }

    if (!have_media) {
        return std::nullopt;
    }

    try {
        counters.bytes_sent = pc_->bytesSent();
        counters.bytes_received = pc_->bytesReceived();
        if (auto rtt = pc_->rtt()) {
            counters.round_trip_ms = static_cast<double>(rtt->count());
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Failed to read transport stats for %s: %s\n", remote_id_.c_str(), e.what());
        return std::nullopt;
    }
    return counters;
}

bool RtcLinkTransport::apply_encoding(const quality::EncodingLimits& limits) {
    std::lock_guard<std::mutex> lock(media_mutex_);
    limits_ = limits;
    have_limits_ = true;

    // Without media the limits wait for attach_outgoing_media
    if (!video_track_) {
        return true;
    }

    vp8_.set_limits(limits.video.max_bitrate_bps, limits.video.max_framerate,
                    limits.video.scale_down_factor);
    if (opus_.is_initialized() && !opus_.set_bitrate(static_cast<int>(limits.audio.max_bitrate_bps))) {
        return false;
    }
    return true;
}

void RtcLinkTransport::close() {
    detach_outgoing_media();
    try {
        pc_->resetCallbacks();
        pc_->close();
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Close failed for %s: %s\n", remote_id_.c_str(), e.what());
    }
}

void RtcLinkTransport::on_local_candidate(CandidateCallback callback) {
    pc_->onLocalCandidate([callback](rtc::Candidate candidate) {
        callback(IceCandidate{std::string(candidate), candidate.mid()});
    });
}

void RtcLinkTransport::on_state_change(StateCallback callback) {
    pc_->onStateChange([callback](rtc::PeerConnection::State state) {
        callback(to_link_state(state));
    });
}

void RtcLinkTransport::on_control_channel(ChannelCallback callback) {
    bool debug = debug_;
    pc_->onDataChannel([callback, debug](std::shared_ptr<rtc::DataChannel> channel) {
        callback(std::make_shared<RtcControlChannel>(channel, debug));
    });
}

void RtcLinkTransport::on_track(TrackCallback callback) {
    pc_->onTrack([callback](std::shared_ptr<rtc::Track> track) {
        callback(IncomingTrack{track->description().type(), track->mid()});
    });
}

// ============================================================================
// Factory
// ============================================================================

RtcTransportFactory::RtcTransportFactory(std::vector<std::string> ice_servers,
                                         protocol::Role local_role, bool debug)
    : ice_servers_(std::move(ice_servers))
    , role_(local_role)
    , debug_(debug)
{}

std::unique_ptr<LinkTransport> RtcTransportFactory::create(const std::string& remote_id, bool offerer) {
    rtc::Configuration config;
    for (const auto& server : ice_servers_) {
        config.iceServers.emplace_back(server);
    }
    // Offers and answers are created explicitly by the manager
    config.disableAutoNegotiation = true;

    if (debug_) {
        fprintf(stderr, "[WebRTC] New transport for %s (%s, %zu ICE servers)\n",
                remote_id.c_str(), offerer ? "offerer" : "answerer", ice_servers_.size());
    }
    return std::make_unique<RtcLinkTransport>(remote_id, role_, config, debug_);
}

} // namespace webrtc
