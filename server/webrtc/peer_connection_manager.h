/*
 * Peer Connection Manager
 *
 * Owns one PeerLink per remote participant and drives its lifecycle:
 * - offer/answer/ICE exchange through the signaling channel
 * - the "control" data channel, wired to the ControlDispatcher
 * - an AdaptiveBitrateController (and its ConnectionMonitor) per link
 * - fan-out of host capture frames to every link with outgoing media
 *
 * Everything except push_video_frame/push_audio_frame must be called on
 * the event loop thread. Transport callbacks arrive on libdatachannel
 * threads and are posted to the loop; a callback from a link that has
 * since been torn down (or replaced) is ignored.
 *
 * A host that has not started capture queues incoming offers instead of
 * answering them; start_capture() replays the queue.
 */

#ifndef PEER_CONNECTION_MANAGER_H
#define PEER_CONNECTION_MANAGER_H

#include "link_transport.h"
#include "../event/event_loop.h"
#include "../protocol/control_dispatcher.h"
#include "../protocol/file_transfer.h"
#include "../quality/adaptive_bitrate.h"
#include "../signaling/participant_directory.h"
#include "../signaling/signaling_channel.h"
#include "../utils/notice.h"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace webrtc {

// Connection indicator shown to the user
enum class Indicator {
    Excellent,
    Good,
    Fair,
    Poor,
    Offline
};

const char* indicator_name(Indicator indicator);
Indicator indicator_for_state(LinkState state);
Indicator indicator_for_quality(quality::QualityCategory category);

struct ManagerSettings {
    std::string self_id;
    protocol::Role role = protocol::Role::Host;
    quality::BitrateSettings bitrate;
    quality::MonitorSettings monitor;
    protocol::DispatcherSettings dispatcher;
    bool debug_connection = false;
    bool debug_transfer = false;
};

struct PeerLink {
    std::string remote_id;
    bool offerer = false;
    uint64_t generation = 0;
    std::shared_ptr<LinkTransport> transport;
    std::shared_ptr<ControlChannel> channel;
    bool channel_open = false;
    std::deque<std::string> outbox;                 // frames queued until the channel opens
    std::vector<IceCandidate> pending_candidates;   // held until a remote description exists
    std::optional<IncomingTrack> incoming_track;    // most recent inbound media
    LinkState state = LinkState::New;
    Indicator indicator = Indicator::Offline;
    std::unique_ptr<quality::AdaptiveBitrateController> bitrate;
};

struct LinkSnapshot {
    std::string remote_id;
    LinkState state = LinkState::New;
    SignalingState signaling = SignalingState::Stable;
    Indicator indicator = Indicator::Offline;
    bool channel_open = false;
    bool outgoing_media = false;
    bool incoming_media = false;
    std::optional<quality::NetworkStats> stats;
    std::optional<quality::QualityMetrics> quality;
    std::optional<quality::QualityMetrics> average_quality;
    std::string preset_key;
    std::string preset_name;
    bool auto_adjust = true;
};

class PeerConnectionManager {
public:
    static constexpr size_t FILE_BUFFER_HIGH = 1024 * 1024;
    static constexpr std::chrono::milliseconds FILE_PUMP_INTERVAL{20};

    using IndicatorCallback = std::function<void(const std::string& remote_id, Indicator indicator)>;

    PeerConnectionManager(event::Loop& loop,
                          signaling::SignalingChannel& signaling,
                          TransportFactory& factory,
                          ManagerSettings settings,
                          notice::NoticeCallback notify = nullptr);
    ~PeerConnectionManager();

    PeerConnectionManager(const PeerConnectionManager&) = delete;
    PeerConnectionManager& operator=(const PeerConnectionManager&) = delete;

    // Start the dispatcher's transfer sweep
    void start();

    // Tear down every link and stop background timers
    void shutdown();

    // Route one inbound signaling record (filters by recipient)
    void handle_signal(const signaling::SignalRecord& record);

    // Existing link or a new one. The offering side creates the control channel.
    PeerLink& ensure_link(const std::string& remote_id, bool offerer);

    bool create_and_send_offer(const std::string& remote_id);
    void handle_offer(const std::string& sender_id, const SessionDescription& offer);
    void handle_answer(const std::string& sender_id, const SessionDescription& answer);
    void handle_ice_candidate(const std::string& sender_id, const IceCandidate& candidate);
    void handle_participant(const signaling::Participant& participant);

    // Idempotent; unknown ids are ignored
    void teardown_link(std::string remote_id, const char* reason = "teardown");
    void teardown_all();

    // Host capture. start_capture attaches media to every link, renegotiates
    // the stable ones and answers queued offers.
    bool start_capture();
    void stop_capture();
    bool capture_active() const { return capture_active_; }

    // Any thread
    void push_video_frame(const uint8_t* bgra, int width, int height, int stride, uint64_t timestamp_us);
    void push_audio_frame(const int16_t* pcm, int frame_size);

    /**
     * Send one control message to one link
     * @return true when it went out now; false when it was queued for a
     *         channel that is not open yet, or refused
     */
    bool send_control(const std::string& remote_id, const protocol::ControlMessage& message);

    // Send to every link this role talks to. Returns the number sent now.
    size_t broadcast_control(const protocol::ControlMessage& message);

    /**
     * Send a file. Empty target: controller sends to hosts, host to every
     * joined controller. Chunks pause while a recipient's channel holds more
     * than FILE_BUFFER_HIGH bytes and resume from a loop timer, so the
     * report covers what went out before the first pause.
     */
    protocol::SendReport send_file(const protocol::OutgoingFile& file, const std::string& target = "");
    size_t outgoing_file_count() const { return outgoing_files_.size(); }

    std::optional<LinkSnapshot> snapshot(const std::string& remote_id) const;
    std::vector<std::string> link_ids() const;
    bool has_link(const std::string& remote_id) const { return links_.count(remote_id) != 0; }
    size_t link_count() const { return links_.size(); }
    size_t pending_offer_count() const { return pending_offers_.size(); }

    bool set_auto_adjust(const std::string& remote_id, bool enabled);
    bool set_preset(const std::string& remote_id, const std::string& key);
    bool force_preset(const std::string& remote_id, const std::string& key);

    void set_control_enabled(bool enabled) { dispatcher_.set_control_enabled(enabled); }
    void set_allow_clipboard(bool allowed) { dispatcher_.set_allow_clipboard(allowed); }

    protocol::ControlDispatcher& dispatcher() { return dispatcher_; }
    const signaling::ParticipantDirectory& directory() const { return directory_; }
    const ManagerSettings& settings() const { return settings_; }

    void on_indicator_change(IndicatorCallback callback) { indicator_callback_ = std::move(callback); }

private:
    struct PendingOffer {
        SessionDescription offer;
        std::vector<IceCandidate> candidates;   // trickled in while the offer waited
    };

    PeerLink* find_link(const std::string& remote_id, uint64_t generation);
    void post_to_link(const std::string& remote_id, uint64_t generation,
                      std::function<void(PeerLink&)> action);

    // Transport callbacks, control channel and bitrate controller of a new link
    void wire_link(PeerLink& link);
    void wire_channel(PeerLink& link, std::shared_ptr<ControlChannel> channel);
    void handle_channel_open(PeerLink& link);
    void handle_state_change(PeerLink& link, LinkState state);
    void set_indicator(PeerLink& link, Indicator indicator);

    bool answer_offer(const std::string& sender_id, const SessionDescription& offer);
    bool renegotiate(PeerLink& link);
    void apply_pending_candidates(PeerLink& link);
    bool publish(const std::string& type, const nlohmann::json& payload, const std::string& recipient);

    bool deliver(PeerLink& link, const std::string& frame, bool queue_if_closed);
    bool send_file_frame(const std::string& recipient, const protocol::ControlMessage& message);
    bool file_recipient_ready(const std::string& recipient) const;
    void pump_files();
    void finish_file(const protocol::FileSender& sender);
    bool may_send(const protocol::ControlMessage& message) const;
    std::vector<std::string> file_recipients() const;

    void refresh_media_targets();
    void notify(notice::Level level, const std::string& title, const std::string& text);

    event::Loop& loop_;
    signaling::SignalingChannel& signaling_;
    TransportFactory& factory_;
    ManagerSettings settings_;
    notice::NoticeCallback notify_;

    std::map<std::string, PeerLink> links_;
    std::map<std::string, PendingOffer> pending_offers_;
    signaling::ParticipantDirectory directory_;
    protocol::ControlDispatcher dispatcher_;
    std::vector<std::unique_ptr<protocol::FileSender>> outgoing_files_;
    event::TimerId file_timer_ = 0;
    uint64_t next_generation_ = 1;
    bool capture_active_ = false;

    // Transports with outgoing media, read by capture threads
    std::mutex media_mutex_;
    std::vector<std::shared_ptr<LinkTransport>> media_targets_;

    // Posted tasks hold a weak reference and skip themselves once the manager is gone
    std::shared_ptr<bool> alive_;

    IndicatorCallback indicator_callback_;
};

} // namespace webrtc

#endif // PEER_CONNECTION_MANAGER_H
