/*
 * Link Transport Interface
 *
 * The per-peer connection handle the PeerConnectionManager drives. The
 * libdatachannel implementation lives in rtc_link_transport.h; tests use
 * an in-memory fake.
 *
 * Callbacks may be raised on any thread. The manager posts them to its
 * event loop before touching link state.
 */

#ifndef LINK_TRANSPORT_H
#define LINK_TRANSPORT_H

#include "../quality/network_stats.h"
#include "../quality/quality_preset.h"
#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace webrtc {

enum class LinkState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

const char* link_state_name(LinkState state);

// Disconnected/Failed/Closed end a link; reconnecting needs a fresh one
inline bool is_terminal(LinkState state) {
    return state == LinkState::Disconnected ||
           state == LinkState::Failed ||
           state == LinkState::Closed;
}

enum class SignalingState {
    Stable,
    HaveLocalOffer,
    HaveRemoteOffer
};

const char* signaling_state_name(SignalingState state);

struct SessionDescription {
    std::string type;       // "offer" or "answer"
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string mid;
};

struct IncomingTrack {
    std::string kind;       // "video" or "audio"
    std::string mid;
};

// Reliable, ordered text channel carrying control messages
class ControlChannel {
public:
    using OpenCallback = std::function<void()>;
    using MessageCallback = std::function<void(const std::string&)>;
    using ClosedCallback = std::function<void()>;

    virtual ~ControlChannel() = default;

    virtual std::string label() const = 0;
    virtual bool is_open() const = 0;

    // True once the frame is accepted, whether sent at once or buffered.
    // False when the channel is not open or the send failed.
    virtual bool send(const std::string& text) = 0;
    virtual void close() = 0;

    // Bytes accepted but not yet handed to the transport
    virtual size_t buffered_amount() const = 0;

    virtual void on_open(OpenCallback callback) = 0;
    virtual void on_message(MessageCallback callback) = 0;
    virtual void on_closed(ClosedCallback callback) = 0;
};

class LinkTransport {
public:
    using CandidateCallback = std::function<void(const IceCandidate&)>;
    using StateCallback = std::function<void(LinkState)>;
    using ChannelCallback = std::function<void(std::shared_ptr<ControlChannel>)>;
    using TrackCallback = std::function<void(const IncomingTrack&)>;

    virtual ~LinkTransport() = default;

    // Generate and apply a local description; nullopt on failure
    virtual std::optional<SessionDescription> create_offer() = 0;
    virtual std::optional<SessionDescription> create_answer() = 0;

    // Throws std::exception when the description cannot be applied
    virtual void set_remote_description(const SessionDescription& description) = 0;
    virtual void add_remote_candidate(const IceCandidate& candidate) = 0;

    virtual bool has_remote_description() const = 0;
    virtual SignalingState signaling_state() const = 0;
    virtual LinkState state() const = 0;

    // Offering side only; the answering side gets the channel via on_control_channel
    virtual std::shared_ptr<ControlChannel> create_control_channel(const std::string& label) = 0;

    // Add send-only video/audio tracks with their own encoders
    virtual bool attach_outgoing_media() = 0;
    virtual void detach_outgoing_media() = 0;
    virtual bool has_outgoing_media() const = 0;

    // Encode and send one capture frame / one 20ms PCM frame. Thread-safe.
    virtual bool send_video_frame(const uint8_t* bgra, int width, int height, int stride,
                                  uint64_t timestamp_us) = 0;
    virtual bool send_audio_samples(const int16_t* pcm, int frame_size) = 0;

    // Cumulative counters; nullopt while no media is flowing
    virtual std::optional<quality::TransportCounters> read_counters() = 0;

    // Push encoding limits to the outgoing encoders
    virtual bool apply_encoding(const quality::EncodingLimits& limits) = 0;

    virtual void close() = 0;

    virtual void on_local_candidate(CandidateCallback callback) = 0;
    virtual void on_state_change(StateCallback callback) = 0;
    virtual void on_control_channel(ChannelCallback callback) = 0;
    virtual void on_track(TrackCallback callback) = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    // offerer: this side will create the offer and the control channel
    virtual std::unique_ptr<LinkTransport> create(const std::string& remote_id, bool offerer) = 0;
};

} // namespace webrtc

#endif // LINK_TRANSPORT_H
