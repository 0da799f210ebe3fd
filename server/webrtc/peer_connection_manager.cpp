/*
 * Peer Connection Manager Implementation
 */

#include "peer_connection_manager.h"
#include "../utils/json_utils.h"
#include <cstdio>
#include <stdexcept>

namespace webrtc {

const char* indicator_name(Indicator indicator) {
    switch (indicator) {
        case Indicator::Excellent: return "excellent";
        case Indicator::Good: return "good";
        case Indicator::Fair: return "fair";
        case Indicator::Poor: return "poor";
        case Indicator::Offline: return "offline";
    }
    return "offline";
}

Indicator indicator_for_state(LinkState state) {
    switch (state) {
        case LinkState::Connected: return Indicator::Good;
        case LinkState::Connecting: return Indicator::Fair;
        default: return Indicator::Offline;
    }
}

Indicator indicator_for_quality(quality::QualityCategory category) {
    switch (category) {
        case quality::QualityCategory::Excellent: return Indicator::Excellent;
        case quality::QualityCategory::Good: return Indicator::Good;
        case quality::QualityCategory::Fair: return Indicator::Fair;
        case quality::QualityCategory::Poor: return Indicator::Poor;
    }
    return Indicator::Good;
}

PeerConnectionManager::PeerConnectionManager(event::Loop& loop,
                                             signaling::SignalingChannel& signaling,
                                             TransportFactory& factory,
                                             ManagerSettings settings,
                                             notice::NoticeCallback notify)
    : loop_(loop)
    , signaling_(signaling)
    , factory_(factory)
    , settings_(std::move(settings))
    , notify_(std::move(notify))
    , dispatcher_(settings_.role, loop, settings_.dispatcher, notify_)
    , alive_(std::make_shared<bool>(true))
{}

PeerConnectionManager::~PeerConnectionManager() {
    alive_.reset();
    shutdown();
}

void PeerConnectionManager::start() {
    dispatcher_.start();
}

void PeerConnectionManager::shutdown() {
    teardown_all();
    outgoing_files_.clear();
    if (file_timer_ != 0) {
        loop_.cancel(file_timer_);
        file_timer_ = 0;
    }
    dispatcher_.stop();
}

void PeerConnectionManager::notify(notice::Level level, const std::string& title, const std::string& text) {
    if (notify_) {
        notify_(level, title, text);
    }
}

// ============================================================================
// Link table
// ============================================================================

PeerLink* PeerConnectionManager::find_link(const std::string& remote_id, uint64_t generation) {
    auto it = links_.find(remote_id);
    if (it == links_.end() || it->second.generation != generation) {
        return nullptr;
    }
    return &it->second;
}

void PeerConnectionManager::post_to_link(const std::string& remote_id, uint64_t generation,
                                         std::function<void(PeerLink&)> action) {
    std::weak_ptr<bool> alive = alive_;
    bool debug = settings_.debug_connection;
    loop_.post([this, alive, remote_id, generation, debug, action = std::move(action)]() {
        if (alive.expired()) return;
        PeerLink* link = find_link(remote_id, generation);
        if (!link) {
            if (debug) {
                fprintf(stderr, "[WebRTC] Ignoring event from closed link %s\n", remote_id.c_str());
            }
            return;
        }
        action(*link);
    });
}

PeerLink& PeerConnectionManager::ensure_link(const std::string& remote_id, bool offerer) {
    auto it = links_.find(remote_id);
    if (it != links_.end()) {
        return it->second;
    }

    std::unique_ptr<LinkTransport> created = factory_.create(remote_id, offerer);
    if (!created) {
        throw std::runtime_error("no transport for " + remote_id);
    }

    PeerLink& link = links_[remote_id];
    link.remote_id = remote_id;
    link.offerer = offerer;
    link.generation = next_generation_++;
    link.transport = std::move(created);

    try {
        wire_link(link);
    } catch (const std::exception&) {
        if (link.bitrate) {
            link.bitrate->destroy();
        }
        link.transport->close();
        links_.erase(remote_id);
        throw;
    }

    if (settings_.debug_connection) {
        fprintf(stderr, "[WebRTC] Created link to %s (%s)\n",
                remote_id.c_str(), offerer ? "offerer" : "answerer");
    }
    return links_.at(remote_id);
}

void PeerConnectionManager::wire_link(PeerLink& link) {
    const std::string remote_id = link.remote_id;
    const uint64_t generation = link.generation;
    std::shared_ptr<LinkTransport> transport = link.transport;

    transport->on_local_candidate([this, remote_id, generation](const IceCandidate& candidate) {
        post_to_link(remote_id, generation, [this, candidate](PeerLink& l) {
            nlohmann::json payload = {
                {"candidate", candidate.candidate},
                {"sdpMid", candidate.mid}
            };
            publish("ice", payload, l.remote_id);
        });
    });

    transport->on_state_change([this, remote_id, generation](LinkState state) {
        post_to_link(remote_id, generation, [this, state](PeerLink& l) {
            handle_state_change(l, state);
        });
    });

    transport->on_track([this, remote_id, generation](const IncomingTrack& track) {
        post_to_link(remote_id, generation, [this, track](PeerLink& l) {
            l.incoming_track = track;
            if (settings_.debug_connection) {
                fprintf(stderr, "[WebRTC] Incoming %s track from %s (mid=%s)\n",
                        track.kind.c_str(), l.remote_id.c_str(), track.mid.c_str());
            }
        });
    });

    if (link.offerer) {
        wire_channel(link, transport->create_control_channel("control"));
    } else {
        transport->on_control_channel([this, remote_id, generation](std::shared_ptr<ControlChannel> channel) {
            post_to_link(remote_id, generation, [this, channel](PeerLink& l) {
                if (l.channel) {
                    fprintf(stderr, "[WebRTC] Ignoring extra data channel '%s' from %s\n",
                            channel->label().c_str(), l.remote_id.c_str());
                    return;
                }
                wire_channel(l, channel);
            });
        });
    }

    // Quality monitor + bitrate controller, running for the life of the link
    quality::BitrateSettings bitrate_settings = settings_.bitrate;
    bitrate_settings.label = remote_id;
    quality::MonitorSettings monitor_settings = settings_.monitor;
    monitor_settings.label = remote_id;

    link.bitrate = std::make_unique<quality::AdaptiveBitrateController>(
        loop_,
        [transport]() { return transport->read_counters(); },
        [transport](const quality::EncodingLimits& limits) { return transport->apply_encoding(limits); },
        bitrate_settings,
        monitor_settings);

    link.bitrate->monitor().on_quality([this, remote_id, generation](const quality::QualityMetrics& metrics) {
        PeerLink* l = find_link(remote_id, generation);
        if (l && l->state == LinkState::Connected) {
            set_indicator(*l, indicator_for_quality(metrics.category));
        }
    });
    link.bitrate->start();

    if (settings_.role == protocol::Role::Host && capture_active_) {
        if (transport->attach_outgoing_media()) {
            refresh_media_targets();
        }
    }
}

void PeerConnectionManager::teardown_link(std::string remote_id, const char* reason) {
    pending_offers_.erase(remote_id);

    auto it = links_.find(remote_id);
    if (it == links_.end()) {
        return;
    }

    // Out of the table first: events raised while closing find nothing
    PeerLink link = std::move(it->second);
    links_.erase(it);

    fprintf(stderr, "[WebRTC] Closing link to %s (%s)\n", remote_id.c_str(), reason);

    if (link.bitrate) {
        link.bitrate->destroy();
    }
    if (link.channel) {
        link.channel->close();
    }
    if (link.transport) {
        link.transport->close();
    }

    refresh_media_targets();
    size_t dropped = dispatcher_.drop_transfers_from(remote_id);
    if (dropped > 0) {
        fprintf(stderr, "[WebRTC] Dropped %zu unfinished transfer(s) from %s\n", dropped, remote_id.c_str());
    }

    if (link.indicator != Indicator::Offline && indicator_callback_) {
        indicator_callback_(remote_id, Indicator::Offline);
    }
}

void PeerConnectionManager::teardown_all() {
    std::vector<std::string> ids = link_ids();
    for (const auto& id : ids) {
        teardown_link(id, "shutdown");
    }
    pending_offers_.clear();
}

std::vector<std::string> PeerConnectionManager::link_ids() const {
    std::vector<std::string> ids;
    ids.reserve(links_.size());
    for (const auto& [id, link] : links_) {
        ids.push_back(id);
    }
    return ids;
}

// ============================================================================
// State and indicator
// ============================================================================

void PeerConnectionManager::set_indicator(PeerLink& link, Indicator indicator) {
    if (link.indicator == indicator) {
        return;
    }
    link.indicator = indicator;
    if (settings_.debug_connection) {
        fprintf(stderr, "[WebRTC] Link %s indicator: %s\n", link.remote_id.c_str(), indicator_name(indicator));
    }
    if (indicator_callback_) {
        indicator_callback_(link.remote_id, indicator);
    }
}

void PeerConnectionManager::handle_state_change(PeerLink& link, LinkState state) {
    if (link.state == state) {
        return;
    }
    link.state = state;

    if (state == LinkState::Connected || state == LinkState::Failed) {
        fprintf(stderr, "[WebRTC] Link %s %s\n", link.remote_id.c_str(), link_state_name(state));
    } else if (settings_.debug_connection) {
        fprintf(stderr, "[WebRTC] Link %s state: %s\n", link.remote_id.c_str(), link_state_name(state));
    }

    if (is_terminal(state)) {
        // No revival; a reconnect goes through a fresh handshake
        teardown_link(link.remote_id, link_state_name(state));
        return;
    }

    Indicator indicator = indicator_for_state(state);
    if (state == LinkState::Connected && link.bitrate) {
        if (auto current = link.bitrate->monitor().current_quality()) {
            indicator = indicator_for_quality(current->category);
        }
    }
    if (state != LinkState::New) {
        set_indicator(link, indicator);
    }
}

// ============================================================================
// Signaling
// ============================================================================

bool PeerConnectionManager::publish(const std::string& type, const nlohmann::json& payload,
                                    const std::string& recipient) {
    signaling::SignalRecord record;
    record.type = type;
    record.payload = payload;
    record.sender_id = settings_.self_id;
    record.recipient_id = recipient;

    bool ok = false;
    try {
        ok = signaling_.publish(record);
    } catch (const std::exception& e) {
        fprintf(stderr, "[Signaling] Publish of %s threw: %s\n", type.c_str(), e.what());
    }

    if (!ok) {
        fprintf(stderr, "[Signaling] Failed to send %s to %s\n", type.c_str(), recipient.c_str());
        notify(notice::Level::Warning, "Signaling failed",
               "Could not send " + type + " to " + recipient);
        return false;
    }
    if (settings_.debug_connection && type != "ice") {
        fprintf(stderr, "[Signaling] Sent %s to %s\n", type.c_str(), recipient.c_str());
    }
    return true;
}

void PeerConnectionManager::handle_signal(const signaling::SignalRecord& record) {
    if (!signaling::is_addressed_to(record, settings_.self_id) || record.sender_id == settings_.self_id) {
        return;
    }

    if (settings_.debug_connection && record.type != "ice") {
        fprintf(stderr, "[Signaling] Received %s from %s\n", record.type.c_str(), record.sender_id.c_str());
    }

    try {
        if (record.type == "offer" || record.type == "answer") {
            SessionDescription description;
            description.type = json_utils::get_string(record.payload, "type", record.type);
            description.sdp = json_utils::get_string(record.payload, "sdp");
            if (record.sender_id.empty() || description.sdp.empty()) {
                fprintf(stderr, "[Signaling] Dropping %s without sender or sdp\n", record.type.c_str());
                return;
            }
            if (record.type == "offer") {
                handle_offer(record.sender_id, description);
            } else {
                handle_answer(record.sender_id, description);
            }
        } else if (record.type == "ice") {
            IceCandidate candidate;
            candidate.candidate = json_utils::get_string(record.payload, "candidate");
            candidate.mid = json_utils::get_string(record.payload, "sdpMid");
            if (record.sender_id.empty() || candidate.candidate.empty()) {
                return;     // end-of-candidates marker
            }
            handle_ice_candidate(record.sender_id, candidate);
        } else if (record.type == "participant") {
            auto participant = signaling::parse_participant(record);
            if (!participant) {
                fprintf(stderr, "[Signaling] Dropping malformed participant record\n");
                return;
            }
            handle_participant(*participant);
        } else if (record.type == "session_status") {
            std::string status = json_utils::get_string(record.payload, "status");
            fprintf(stderr, "[Signaling] Session status: %s\n", status.c_str());
            if (status == "ended") {
                teardown_all();
            }
        } else if (settings_.debug_connection) {
            fprintf(stderr, "[Signaling] Ignoring record type '%s'\n", record.type.c_str());
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "[Signaling] Error handling %s from %s: %s\n",
                record.type.c_str(), record.sender_id.c_str(), e.what());
    }
}

void PeerConnectionManager::handle_participant(const signaling::Participant& participant) {
    if (participant.id == settings_.self_id) {
        return;
    }

    auto change = directory_.update(participant);

    if (participant.status == signaling::ParticipantStatus::Left) {
        if (has_link(participant.id) || pending_offers_.count(participant.id)) {
            teardown_link(participant.id, "participant left");
        }
        return;
    }

    if (settings_.debug_connection && change != signaling::ParticipantDirectory::Change::None) {
        fprintf(stderr, "[Signaling] Participant %s joined as %s\n",
                participant.id.c_str(), protocol::role_name(participant.role));
    }

    // Controllers offer to hosts
    if (change == signaling::ParticipantDirectory::Change::Joined &&
        settings_.role == protocol::Role::Controller &&
        participant.role == protocol::Role::Host &&
        !has_link(participant.id)) {
        create_and_send_offer(participant.id);
    }
}

bool PeerConnectionManager::create_and_send_offer(const std::string& remote_id) {
    try {
        PeerLink& link = ensure_link(remote_id, true);
        auto offer = link.transport->create_offer();
        if (!offer) {
            fprintf(stderr, "[WebRTC] Could not create offer for %s\n", remote_id.c_str());
            return false;
        }
        return publish("offer", {{"type", offer->type}, {"sdp", offer->sdp}}, remote_id);
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Offer to %s failed: %s\n", remote_id.c_str(), e.what());
        return false;
    }
}

bool PeerConnectionManager::renegotiate(PeerLink& link) {
    auto offer = link.transport->create_offer();
    if (!offer) {
        fprintf(stderr, "[WebRTC] Could not renegotiate with %s\n", link.remote_id.c_str());
        return false;
    }
    return publish("offer", {{"type", offer->type}, {"sdp", offer->sdp}}, link.remote_id);
}

void PeerConnectionManager::handle_offer(const std::string& sender_id, const SessionDescription& offer) {
    if (settings_.role == protocol::Role::Host && !capture_active_) {
        bool first = pending_offers_.count(sender_id) == 0;
        PendingOffer& pending = pending_offers_[sender_id];
        pending.offer = offer;
        pending.candidates.clear();
        fprintf(stderr, "[WebRTC] Queued offer from %s until screen sharing starts\n", sender_id.c_str());
        if (first) {
            notify(notice::Level::Info, "Connection waiting",
                   sender_id + " is waiting for screen sharing to start");
        }
        return;
    }
    answer_offer(sender_id, offer);
}

bool PeerConnectionManager::answer_offer(const std::string& sender_id, const SessionDescription& offer) {
    bool created = !has_link(sender_id);
    try {
        PeerLink& link = ensure_link(sender_id, false);

        if (link.transport->signaling_state() != SignalingState::Stable) {
            // Duplicate offer, or both sides offered at once
            if (settings_.debug_connection) {
                fprintf(stderr, "[WebRTC] Dropping offer from %s in state %s\n", sender_id.c_str(),
                        signaling_state_name(link.transport->signaling_state()));
            }
            return false;
        }

        link.transport->set_remote_description(offer);
        apply_pending_candidates(link);

        auto answer = link.transport->create_answer();
        if (!answer) {
            fprintf(stderr, "[WebRTC] Could not create answer for %s\n", sender_id.c_str());
            return false;
        }
        return publish("answer", {{"type", answer->type}, {"sdp", answer->sdp}}, sender_id);
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Failed to answer offer from %s: %s\n", sender_id.c_str(), e.what());
        if (created) {
            teardown_link(sender_id, "offer rejected");
        }
        return false;
    }
}

void PeerConnectionManager::handle_answer(const std::string& sender_id, const SessionDescription& answer) {
    auto it = links_.find(sender_id);
    if (it == links_.end()) {
        if (settings_.debug_connection) {
            fprintf(stderr, "[WebRTC] Dropping answer from %s: no link\n", sender_id.c_str());
        }
        return;
    }

    PeerLink& link = it->second;
    if (link.transport->signaling_state() != SignalingState::HaveLocalOffer) {
        if (settings_.debug_connection) {
            fprintf(stderr, "[WebRTC] Dropping stale answer from %s (state %s)\n", sender_id.c_str(),
                    signaling_state_name(link.transport->signaling_state()));
        }
        return;
    }

    try {
        link.transport->set_remote_description(answer);
        apply_pending_candidates(link);
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Failed to apply answer from %s: %s\n", sender_id.c_str(), e.what());
    }
}

void PeerConnectionManager::handle_ice_candidate(const std::string& sender_id, const IceCandidate& candidate) {
    auto it = links_.find(sender_id);
    if (it == links_.end()) {
        auto pending = pending_offers_.find(sender_id);
        if (pending != pending_offers_.end()) {
            pending->second.candidates.push_back(candidate);
        } else if (settings_.debug_connection) {
            fprintf(stderr, "[WebRTC] Dropping ICE candidate from %s: no link\n", sender_id.c_str());
        }
        return;
    }

    PeerLink& link = it->second;
    if (!link.transport->has_remote_description()) {
        link.pending_candidates.push_back(candidate);
        return;
    }

    try {
        link.transport->add_remote_candidate(candidate);
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Bad ICE candidate from %s: %s\n", sender_id.c_str(), e.what());
    }
}

void PeerConnectionManager::apply_pending_candidates(PeerLink& link) {
    for (const auto& candidate : link.pending_candidates) {
        try {
            link.transport->add_remote_candidate(candidate);
        } catch (const std::exception& e) {
            fprintf(stderr, "[WebRTC] Bad buffered ICE candidate from %s: %s\n",
                    link.remote_id.c_str(), e.what());
        }
    }
    link.pending_candidates.clear();
}

// ============================================================================
// Control channel
// ============================================================================

void PeerConnectionManager::wire_channel(PeerLink& link, std::shared_ptr<ControlChannel> channel) {
    link.channel = channel;
    link.channel_open = false;

    const std::string remote_id = link.remote_id;
    const uint64_t generation = link.generation;

    channel->on_open([this, remote_id, generation]() {
        post_to_link(remote_id, generation, [this](PeerLink& l) { handle_channel_open(l); });
    });

    channel->on_message([this, remote_id, generation](const std::string& text) {
        post_to_link(remote_id, generation, [this, text](PeerLink& l) {
            dispatcher_.dispatch(l.remote_id, text);
        });
    });

    channel->on_closed([this, remote_id, generation]() {
        post_to_link(remote_id, generation, [](PeerLink& l) {
            if (l.channel_open) {
                fprintf(stderr, "[Control] Channel to %s closed\n", l.remote_id.c_str());
            }
            l.channel_open = false;
        });
    });

    // The answering side may receive a channel that is already open
    if (channel->is_open()) {
        post_to_link(remote_id, generation, [this](PeerLink& l) { handle_channel_open(l); });
    }
}

void PeerConnectionManager::handle_channel_open(PeerLink& link) {
    if (link.channel_open || !link.channel) {
        return;
    }
    link.channel_open = true;
    fprintf(stderr, "[Control] Channel to %s open\n", link.remote_id.c_str());

    protocol::Capability capability;
    capability.role = protocol::role_name(settings_.role);
    capability.features = {"mouse", "keyboard", "clipboard", "file-transfer"};
    if (!link.channel->send(protocol::encode_control_message(capability))) {
        fprintf(stderr, "[Control] Failed to send capability to %s\n", link.remote_id.c_str());
    }

    size_t flushed = 0;
    while (!link.outbox.empty()) {
        if (!link.channel->send(link.outbox.front())) {
            fprintf(stderr, "[Control] Flush to %s stopped, %zu message(s) still queued\n",
                    link.remote_id.c_str(), link.outbox.size());
            break;
        }
        link.outbox.pop_front();
        flushed++;
    }
    if (flushed > 0 && settings_.debug_connection) {
        fprintf(stderr, "[Control] Flushed %zu queued message(s) to %s\n", flushed, link.remote_id.c_str());
    }
}

bool PeerConnectionManager::deliver(PeerLink& link, const std::string& frame, bool queue_if_closed) {
    if (link.channel && link.channel_open && link.channel->is_open()) {
        if (link.channel->send(frame)) {
            return true;
        }
        fprintf(stderr, "[Control] Send to %s failed\n", link.remote_id.c_str());
        return false;
    }
    if (queue_if_closed) {
        link.outbox.push_back(frame);
        if (settings_.dispatcher.debug_input) {
            fprintf(stderr, "[Control] Queued message for %s (%zu waiting)\n",
                    link.remote_id.c_str(), link.outbox.size());
        }
    }
    return false;
}

bool PeerConnectionManager::may_send(const protocol::ControlMessage& message) const {
    if (!protocol::is_input_message(message)) {
        return true;
    }
    // Pointer/keyboard only flow from a controller that is allowed to control
    return settings_.role == protocol::Role::Controller && dispatcher_.control_enabled();
}

bool PeerConnectionManager::send_control(const std::string& remote_id, const protocol::ControlMessage& message) {
    if (!may_send(message)) {
        if (settings_.dispatcher.debug_input) {
            fprintf(stderr, "[Control] Not sending %s: control disabled\n", protocol::message_type_name(message));
        }
        return false;
    }

    auto it = links_.find(remote_id);
    if (it == links_.end()) {
        return false;
    }
    return deliver(it->second, protocol::encode_control_message(message), true);
}

size_t PeerConnectionManager::broadcast_control(const protocol::ControlMessage& message) {
    if (!may_send(message)) {
        return 0;
    }
    // A host only shares its clipboard
    if (settings_.role == protocol::Role::Host && !std::holds_alternative<protocol::Clipboard>(message)) {
        return 0;
    }

    std::string frame = protocol::encode_control_message(message);
    size_t sent = 0;
    for (auto& [id, link] : links_) {
        if (deliver(link, frame, true)) {
            sent++;
        }
    }
    return sent;
}

std::vector<std::string> PeerConnectionManager::file_recipients() const {
    protocol::Role wanted = settings_.role == protocol::Role::Controller
        ? protocol::Role::Host : protocol::Role::Controller;

    std::vector<std::string> recipients;
    for (const auto& [id, link] : links_) {
        auto role = directory_.role_of(id);
        if (!role || (*role == wanted && directory_.is_joined(id))) {
            recipients.push_back(id);
        }
    }
    return recipients;
}

bool PeerConnectionManager::send_file_frame(const std::string& recipient, const protocol::ControlMessage& message) {
    auto it = links_.find(recipient);
    if (it == links_.end()) {
        return false;
    }
    // Files are not queued: a meta without its chunks would only expire
    return deliver(it->second, protocol::encode_control_message(message), false);
}

bool PeerConnectionManager::file_recipient_ready(const std::string& recipient) const {
    auto it = links_.find(recipient);
    if (it == links_.end() || !it->second.channel) {
        return true;    // the next send fails and drops the recipient
    }
    return it->second.channel->buffered_amount() < FILE_BUFFER_HIGH;
}

protocol::SendReport PeerConnectionManager::send_file(const protocol::OutgoingFile& file, const std::string& target) {
    if (file.data.size() > settings_.dispatcher.max_file_size) {
        fprintf(stderr, "[FileTransfer] Refusing to send %s: %zu bytes over the limit\n",
                file.name.c_str(), file.data.size());
        notify(notice::Level::Warning, "File too large",
               file.name + " exceeds the " +
               std::to_string(settings_.dispatcher.max_file_size / (1024 * 1024)) + " MB limit");
        return protocol::SendReport();
    }

    std::vector<std::string> recipients;
    if (!target.empty()) {
        recipients.push_back(target);
    } else {
        recipients = file_recipients();
    }
    if (recipients.empty()) {
        notify(notice::Level::Warning, "File not sent", "Nobody is connected to receive " + file.name);
        return protocol::SendReport();
    }

    auto send = [this](const std::string& recipient, const protocol::ControlMessage& message) {
        return send_file_frame(recipient, message);
    };
    auto ready = [this](const std::string& recipient) { return file_recipient_ready(recipient); };

    auto sender = std::make_unique<protocol::FileSender>(file, settings_.self_id, recipients,
                                                         settings_.debug_transfer);
    if (!sender->begin(send)) {
        notify(notice::Level::Warning, "File not sent", file.name + " could not be delivered");
        return sender->report();
    }
    if (sender->pump(send, ready)) {
        finish_file(*sender);
        return sender->report();
    }

    if (settings_.debug_transfer) {
        fprintf(stderr, "[FileTransfer] %s paused after %u/%u chunks, channel backed up\n",
                file.name.c_str(), sender->report().chunks_sent, sender->report().total_chunks);
    }
    protocol::SendReport report = sender->report();
    outgoing_files_.push_back(std::move(sender));
    if (file_timer_ == 0) {
        file_timer_ = loop_.schedule_every(FILE_PUMP_INTERVAL, [this]() { pump_files(); });
    }
    return report;
}

void PeerConnectionManager::pump_files() {
    auto send = [this](const std::string& recipient, const protocol::ControlMessage& message) {
        return send_file_frame(recipient, message);
    };
    auto ready = [this](const std::string& recipient) { return file_recipient_ready(recipient); };

    std::vector<std::unique_ptr<protocol::FileSender>> done;
    for (auto it = outgoing_files_.begin(); it != outgoing_files_.end();) {
        if ((*it)->pump(send, ready)) {
            done.push_back(std::move(*it));
            it = outgoing_files_.erase(it);
        } else {
            ++it;
        }
    }

    if (outgoing_files_.empty() && file_timer_ != 0) {
        loop_.cancel(file_timer_);
        file_timer_ = 0;
    }
    for (const auto& sender : done) {
        finish_file(*sender);
    }
}

void PeerConnectionManager::finish_file(const protocol::FileSender& sender) {
    const protocol::SendReport& report = sender.report();
    if (report.complete_sent == 0) {
        notify(notice::Level::Warning, "File not sent", sender.name() + " could not be delivered");
    } else {
        fprintf(stderr, "[FileTransfer] Sent %s (%llu bytes, %u chunks) to %zu peer(s)\n",
                sender.name().c_str(), (unsigned long long)sender.size(), report.total_chunks,
                report.complete_sent);
    }
}

// ============================================================================
// Capture and media
// ============================================================================

bool PeerConnectionManager::start_capture() {
    if (settings_.role != protocol::Role::Host) {
        fprintf(stderr, "[WebRTC] Only a host can share its screen\n");
        return false;
    }
    if (capture_active_) {
        return true;
    }
    capture_active_ = true;
    fprintf(stderr, "[WebRTC] Screen sharing started\n");

    for (auto& [id, link] : links_) {
        if (link.bitrate) {
            link.bitrate->start();
        }
        if (link.transport->has_outgoing_media()) {
            continue;
        }
        if (!link.transport->attach_outgoing_media()) {
            continue;
        }
        // Only links between negotiations can take a new offer now
        if (link.transport->signaling_state() == SignalingState::Stable &&
            link.transport->has_remote_description()) {
            renegotiate(link);
        }
    }
    refresh_media_targets();

    // Answer everyone who offered while we were not sharing
    std::map<std::string, PendingOffer> pending;
    pending.swap(pending_offers_);
    for (const auto& [sender_id, waiting] : pending) {
        if (settings_.debug_connection) {
            fprintf(stderr, "[WebRTC] Replaying queued offer from %s\n", sender_id.c_str());
        }
        handle_offer(sender_id, waiting.offer);
        for (const auto& candidate : waiting.candidates) {
            handle_ice_candidate(sender_id, candidate);
        }
    }
    return true;
}

void PeerConnectionManager::stop_capture() {
    if (!capture_active_) {
        return;
    }
    capture_active_ = false;

    for (auto& [id, link] : links_) {
        link.transport->detach_outgoing_media();
        if (link.bitrate) {
            link.bitrate->stop();
        }
    }
    refresh_media_targets();
    fprintf(stderr, "[WebRTC] Screen sharing stopped\n");
}

void PeerConnectionManager::refresh_media_targets() {
    std::vector<std::shared_ptr<LinkTransport>> targets;
    for (const auto& [id, link] : links_) {
        if (link.transport && link.transport->has_outgoing_media()) {
            targets.push_back(link.transport);
        }
    }
    std::lock_guard<std::mutex> lock(media_mutex_);
    media_targets_.swap(targets);
}

void PeerConnectionManager::push_video_frame(const uint8_t* bgra, int width, int height, int stride,
                                             uint64_t timestamp_us) {
    std::vector<std::shared_ptr<LinkTransport>> targets;
    {
        std::lock_guard<std::mutex> lock(media_mutex_);
        targets = media_targets_;
    }
    for (const auto& transport : targets) {
        transport->send_video_frame(bgra, width, height, stride, timestamp_us);
    }
}

void PeerConnectionManager::push_audio_frame(const int16_t* pcm, int frame_size) {
    std::vector<std::shared_ptr<LinkTransport>> targets;
    {
        std::lock_guard<std::mutex> lock(media_mutex_);
        targets = media_targets_;
    }
    for (const auto& transport : targets) {
        transport->send_audio_samples(pcm, frame_size);
    }
}

// ============================================================================
// Quality query surface
// ============================================================================

std::optional<LinkSnapshot> PeerConnectionManager::snapshot(const std::string& remote_id) const {
    auto it = links_.find(remote_id);
    if (it == links_.end()) {
        return std::nullopt;
    }

    const PeerLink& link = it->second;
    LinkSnapshot snap;
    snap.remote_id = remote_id;
    snap.state = link.state;
    snap.signaling = link.transport->signaling_state();
    snap.indicator = link.indicator;
    snap.channel_open = link.channel_open;
    snap.outgoing_media = link.transport->has_outgoing_media();
    snap.incoming_media = link.incoming_track.has_value();
    if (link.bitrate) {
        const auto& monitor = link.bitrate->monitor();
        snap.stats = monitor.current_stats();
        snap.quality = monitor.current_quality();
        snap.average_quality = monitor.average_quality();
        snap.preset_key = link.bitrate->current_preset().key;
        snap.preset_name = link.bitrate->current_preset().name;
        snap.auto_adjust = link.bitrate->auto_adjust();
    }
    return snap;
}

bool PeerConnectionManager::set_auto_adjust(const std::string& remote_id, bool enabled) {
    auto it = links_.find(remote_id);
    if (it == links_.end() || !it->second.bitrate) {
        return false;
    }
    it->second.bitrate->set_auto_adjust(enabled);
    return true;
}

bool PeerConnectionManager::set_preset(const std::string& remote_id, const std::string& key) {
    auto it = links_.find(remote_id);
    if (it == links_.end() || !it->second.bitrate) {
        return false;
    }
    return it->second.bitrate->set_preset(key);
}

bool PeerConnectionManager::force_preset(const std::string& remote_id, const std::string& key) {
    auto it = links_.find(remote_id);
    if (it == links_.end() || !it->second.bitrate) {
        return false;
    }
    return it->second.bitrate->force_preset(key);
}

} // namespace webrtc
