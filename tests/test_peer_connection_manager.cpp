/*
 *  test_peer_connection_manager.cpp - Link lifecycle orchestration
 *
 *  Runs webrtc::PeerConnectionManager against in-memory transports and
 *  signaling on a ManualLoop: offer/answer/ICE ordering, queued offers on a
 *  host that is not sharing yet, control channel queueing, teardown on
 *  terminal states, stale events, media fan-out and file sends.
 */

#include <stdio.h>

#include <memory>
#include <string>
#include <vector>

#include "control/emulated_adapter.h"
#include "event/event_loop.h"
#include "fake_transport.h"
#include "webrtc/peer_connection_manager.h"

using testing_support::FakeChannel;
using testing_support::FakeLink;
using webrtc::Indicator;
using webrtc::LinkState;
using webrtc::SignalingState;

static int failures = 0;

static void check(bool ok, const char *what)
{
	printf("  %s: %s\n", ok ? "ok  " : "FAIL", what);
	if (!ok) failures++;
}

static bool contains(const std::string &haystack, const std::string &needle)
{
	return haystack.find(needle) != std::string::npos;
}

static signaling::SignalRecord record(const std::string &type, const nlohmann::json &payload,
                                      const std::string &from, const std::string &to = "")
{
	signaling::SignalRecord r;
	r.type = type;
	r.payload = payload;
	r.sender_id = from;
	r.recipient_id = to;
	return r;
}

static nlohmann::json description(const std::string &type, const std::string &sdp)
{
	return {{"type", type}, {"sdp", sdp}};
}

static nlohmann::json candidate(const std::string &text)
{
	return {{"candidate", text}, {"sdpMid", "0"}};
}

struct Harness {
	event::ManualLoop loop;
	testing_support::FakeFactory factory;
	testing_support::FakeSignaling signaling;
	std::vector<std::string> notices;
	std::vector<Indicator> indicators;
	std::unique_ptr<webrtc::PeerConnectionManager> manager;

	Harness(protocol::Role role, const std::string &self_id,
	        uint64_t max_file_size = 100ull * 1024 * 1024)
	{
		webrtc::ManagerSettings settings;
		settings.self_id = self_id;
		settings.role = role;
		settings.dispatcher.max_file_size = max_file_size;

		manager.reset(new webrtc::PeerConnectionManager(loop, signaling, factory, settings,
			[this](notice::Level, const std::string &title, const std::string &) {
				notices.push_back(title);
			}));
		manager->on_indicator_change([this](const std::string &, Indicator indicator) {
			indicators.push_back(indicator);
		});
		manager->start();
	}

	size_t notice_count(const std::string &title) const
	{
		size_t n = 0;
		for (const auto &t : notices) {
			if (t == title) n++;
		}
		return n;
	}
};

// Host that is sharing, with an answered link to ctl-1 and its control channel open
static std::shared_ptr<FakeChannel> connect_controller(Harness &h, const std::string &controller)
{
	h.manager->handle_signal(record("offer", description("offer", "v=0 from " + controller), controller, "host-1"));
	std::shared_ptr<FakeLink> link = h.factory.latest(controller);
	if (!link) return nullptr;
	auto channel = link->emit_channel();
	h.loop.run_pending();
	channel->open();
	h.loop.run_pending();
	return channel;
}

static void test_controller_offer_flow()
{
	printf("\n=== Controller offers to a host ===\n");

	Harness h(protocol::Role::Controller, "ctl-1");

	h.manager->handle_signal(record("participant",
		{{"userId", "host-1"}, {"role", "host"}, {"status", "joined"}}, "host-1"));

	std::shared_ptr<FakeLink> link = h.factory.latest("host-1");
	check(link && link->offerer, "joined host gets an offering link");
	if (!link) return;
	check(link->channel && link->channel->label() == "control", "offerer creates the control channel");
	check(!link->applied_limits.empty() && link->applied_limits[0].video.max_bitrate_bps == 2500000,
	      "initial preset applied to the new link");

	auto offers = h.signaling.of_type("offer");
	check(offers.size() == 1, "one offer published");
	if (offers.size() == 1) {
		check(offers[0].recipient_id == "host-1" && offers[0].sender_id == "ctl-1", "offer addressed to the host");
		check(offers[0].payload.value("type", "") == "offer" && !offers[0].payload.value("sdp", "").empty(),
		      "offer payload carries type and sdp");
	}

	webrtc::PeerLink &again = h.manager->ensure_link("host-1", true);
	check(h.factory.count_for("host-1") == 1 && h.manager->link_count() == 1, "ensure_link returns the existing link");
	check(again.remote_id == "host-1", "same link record");

	h.manager->handle_signal(record("participant",
		{{"userId", "host-1"}, {"role", "host"}, {"status", "joined"}}, "host-1"));
	check(h.signaling.of_type("offer").size() == 1, "repeated join does not offer again");

	// Candidate before the answer waits for it
	h.manager->handle_signal(record("ice", candidate("candidate:1 1 udp 1 10.0.0.2 5000 typ host"), "host-1", "ctl-1"));
	check(link->candidates.empty(), "candidate held until a remote description exists");

	h.manager->handle_signal(record("answer", description("answer", "v=0 host answer"), "host-1", "ctl-1"));
	check(link->signaling == SignalingState::Stable && link->remote_descriptions.size() == 1, "answer applied");
	check(link->candidates.size() == 1, "held candidate applied after the answer");

	h.manager->handle_signal(record("answer", description("answer", "v=0 late answer"), "host-1", "ctl-1"));
	check(link->remote_descriptions.size() == 1, "answer outside have-local-offer is dropped");

	h.manager->handle_signal(record("ice", candidate("candidate:2 1 udp 1 10.0.0.2 5001 typ host"), "host-1", "ctl-1"));
	check(link->candidates.size() == 2, "later candidate applied directly");

	h.manager->handle_signal(record("ice", {{"candidate", ""}}, "host-1", "ctl-1"));
	check(link->candidates.size() == 2, "end-of-candidates marker ignored");

	// Local candidates go out through the loop
	link->emit_candidate("candidate:9 1 udp 1 192.168.1.5 6000 typ host");
	check(h.signaling.of_type("ice").empty(), "nothing published before the loop runs");
	h.loop.run_pending();
	auto ice = h.signaling.of_type("ice");
	check(ice.size() == 1 && ice[0].recipient_id == "host-1" && ice[0].payload.value("sdpMid", "") == "0",
	      "local candidate published with its mid");

	// Messages sent before the channel opens are queued behind the capability frame
	check(!h.manager->send_control("host-1", protocol::Clipboard{"early"}), "send before open is queued");
	link->channel->open();
	h.loop.run_pending();
	check(link->channel->sent.size() == 2, "capability plus one queued message");
	if (link->channel->sent.size() == 2) {
		check(contains(link->channel->sent[0], "capability"), "capability goes first");
		check(contains(link->channel->sent[1], "early"), "queued clipboard flushed");
	}
	check(h.manager->snapshot("host-1")->channel_open, "snapshot shows the open channel");

	check(h.manager->send_control("host-1", protocol::PointerMove{0.5, 0.5}), "controller sends input");
	h.manager->set_control_enabled(false);
	check(!h.manager->send_control("host-1", protocol::PointerMove{0.1, 0.1}), "no input while control is off");
	check(h.manager->send_control("host-1", protocol::Clipboard{"text"}), "clipboard still allowed");
	h.manager->set_control_enabled(true);

	// Indicator follows the connection and then the measured quality
	link->emit_state(LinkState::Connecting);
	h.loop.run_pending();
	link->emit_state(LinkState::Connected);
	h.loop.run_pending();
	check(h.indicators.size() == 2 && h.indicators[0] == Indicator::Fair && h.indicators[1] == Indicator::Good,
	      "connecting is fair, connected is good");

	link->has_counters = true;
	h.loop.advance(std::chrono::milliseconds(1000));
	check(!h.indicators.empty() && h.indicators.back() == Indicator::Excellent, "first quality sample refines the indicator");
	auto snap = h.manager->snapshot("host-1");
	check(snap && snap->quality && snap->quality->score == 90 && snap->preset_key == "high", "snapshot carries quality and preset");

	link->emit_track("video", "video");
	h.loop.run_pending();
	check(h.manager->snapshot("host-1")->incoming_media, "incoming track recorded");

	// Terminal state ends the link
	link->emit_state(LinkState::Failed);
	h.loop.run_pending();
	check(!h.manager->has_link("host-1"), "failed link removed");
	check(link->closed && link->channel->closed, "transport and channel closed");
	check(h.indicators.back() == Indicator::Offline, "indicator goes offline");

	size_t indicator_events = h.indicators.size();
	link->emit_state(LinkState::Connected);
	h.loop.run_pending();
	check(!h.manager->has_link("host-1") && h.indicators.size() == indicator_events,
	      "event from a closed link is ignored");

	// A fresh link to the same peer ignores the old transport
	check(h.manager->create_and_send_offer("host-1"), "new offer after the failure");
	check(h.factory.count_for("host-1") == 2, "new transport created");
	link->emit_state(LinkState::Closed);
	h.loop.run_pending();
	check(h.manager->has_link("host-1"), "old transport cannot close the new link");

	check(!h.manager->start_capture(), "controller cannot share");
}

static void test_host_queues_offers()
{
	printf("\n=== Host queues offers until sharing ===\n");

	Harness h(protocol::Role::Host, "host-1");

	h.manager->handle_signal(record("offer", description("offer", "v=0 ctl offer"), "ctl-1", "host-1"));
	h.manager->handle_signal(record("offer", description("offer", "v=0 ctl offer"), "ctl-1", "host-1"));
	h.manager->handle_signal(record("ice", candidate("candidate:1 1 udp 1 10.0.0.3 5000 typ host"), "ctl-1", "host-1"));

	check(h.manager->pending_offer_count() == 1, "offer queued once per sender");
	check(h.manager->link_count() == 0 && h.signaling.of_type("answer").empty(), "not answered yet");
	check(h.notice_count("Connection waiting") == 1, "one waiting notice");

	check(h.manager->start_capture(), "sharing starts");
	check(h.manager->pending_offer_count() == 0, "queue drained");

	std::shared_ptr<FakeLink> link = h.factory.latest("ctl-1");
	check(link && !link->offerer, "answering link created");
	if (!link) return;
	check(link->media && link->attach_count == 1, "outgoing media attached");
	check(link->remote_descriptions.size() == 1 && link->remote_descriptions[0].sdp == "v=0 ctl offer",
	      "queued offer applied");
	check(link->candidates.size() == 1, "candidate that arrived with the queued offer applied");
	auto answers = h.signaling.of_type("answer");
	check(answers.size() == 1 && answers[0].recipient_id == "ctl-1", "answer sent to the controller");

	// Offerer's channel arrives on the answering side
	auto channel = link->emit_channel();
	h.loop.run_pending();
	channel->open();
	h.loop.run_pending();
	check(!channel->sent.empty() && contains(channel->sent[0], "\"role\":\"host\""), "host announces its role");

	control::EmulatedAdapter adapter(101, 101);
	adapter.init();
	h.manager->dispatcher().set_adapter(&adapter);
	channel->receive("{\"type\":\"mousemove\",\"x\":1.0,\"y\":1.0}");
	h.loop.run_pending();
	check(adapter.cursor_x() == 100 && adapter.cursor_y() == 100, "remote pointer reaches the adapter");
	channel->receive("{\"type\":\"mousemove\"");
	h.loop.run_pending();
	check(h.manager->has_link("ctl-1"), "malformed frame leaves the link up");

	uint8_t frame[16 * 16 * 4] = {0};
	int16_t pcm[960 * 2] = {0};
	h.manager->push_video_frame(frame, 16, 16, 16 * 4, 0);
	h.manager->push_audio_frame(pcm, 960);
	check(link->video_frames == 1 && link->audio_frames == 1, "capture frames fan out to the link");

	check(!h.manager->send_control("ctl-1", protocol::Key{"a", "KeyA", protocol::Phase::Down, std::nullopt}),
	      "host does not send input");
	check(h.manager->broadcast_control(protocol::Clipboard{"shared"}) == 1, "host broadcasts clipboard");
	check(h.manager->broadcast_control(protocol::Capability{"host", {}}) == 0, "host broadcasts nothing else");

	check(h.manager->set_preset("ctl-1", "low") &&
	      link->applied_limits.back().video.max_bitrate_bps == 600000, "manual preset reaches the encoders");
	check(h.manager->force_preset("ctl-1", "medium") && !h.manager->snapshot("ctl-1")->auto_adjust,
	      "forced preset turns auto mode off");
	check(!h.manager->set_preset("nobody", "low"), "preset for unknown link refused");

	// Stop and restart sharing renegotiates the stable link
	h.manager->stop_capture();
	check(!link->media, "media detached when sharing stops");
	h.manager->push_video_frame(frame, 16, 16, 16 * 4, 1000);
	check(link->video_frames == 1, "no frames while not sharing");

	h.manager->start_capture();
	check(link->media && link->attach_count == 2, "media attached again");
	auto offers = h.signaling.of_type("offer");
	check(offers.size() == 1 && offers[0].recipient_id == "ctl-1", "stable link renegotiated");

	// Remote offer while ours is outstanding
	h.manager->handle_signal(record("offer", description("offer", "v=0 glare"), "ctl-1", "host-1"));
	check(h.signaling.of_type("answer").size() == 1, "offer during have-local-offer is dropped");
	h.manager->handle_signal(record("answer", description("answer", "v=0 ctl answer"), "ctl-1", "host-1"));
	check(link->signaling == SignalingState::Stable, "renegotiation answered");

	h.manager->handle_signal(record("participant", {{"role", "controller"}, {"status", "left"}}, "ctl-1"));
	check(!h.manager->has_link("ctl-1") && link->closed, "participant leaving tears the link down");
}

static void test_host_rejections()
{
	printf("\n=== Host rejections and addressing ===\n");

	Harness h(protocol::Role::Host, "host-1");
	h.manager->start_capture();

	h.factory.prepare = [](FakeLink &l) { l.reject_remote = true; };
	h.manager->handle_signal(record("offer", description("offer", "garbage"), "ctl-2", "host-1"));
	h.factory.prepare = nullptr;
	check(!h.manager->has_link("ctl-2"), "link removed when its offer cannot be applied");
	check(h.factory.latest("ctl-2") && h.factory.latest("ctl-2")->closed, "rejected transport closed");

	h.manager->handle_signal(record("offer", description("offer", "v=0"), "ctl-3", "host-9"));
	check(!h.manager->has_link("ctl-3"), "record for someone else ignored");
	h.manager->handle_signal(record("offer", description("offer", "v=0"), "host-1", "host-1"));
	check(h.manager->link_count() == 0, "own record ignored");
	h.manager->handle_signal(record("offer", {{"type", "offer"}}, "ctl-3", "host-1"));
	check(h.manager->link_count() == 0, "offer without sdp dropped");
	h.manager->handle_signal(record("answer", description("answer", "v=0"), "ctl-4", "host-1"));
	check(h.manager->link_count() == 0, "answer without a link dropped");

	h.factory.fail_create = true;
	h.manager->handle_signal(record("offer", description("offer", "v=0"), "ctl-5", "host-1"));
	h.factory.fail_create = false;
	check(h.manager->link_count() == 0, "no link when the transport cannot be created");

	h.manager->handle_signal(record("offer", description("offer", "v=0 a"), "ctl-6", "host-1"));
	h.manager->handle_signal(record("offer", description("offer", "v=0 b"), "ctl-7", "host-1"));
	check(h.manager->link_count() == 2, "two controllers connected");
	h.manager->handle_signal(record("session_status", {{"status", "ended"}}, "server"));
	check(h.manager->link_count() == 0, "ended session tears everything down");

	h.signaling.connected = false;
	h.manager->handle_signal(record("offer", description("offer", "v=0 c"), "ctl-8", "host-1"));
	check(h.notice_count("Signaling failed") == 1, "failed publish raises a notice");
}

static void test_file_sends()
{
	printf("\n=== File sends ===\n");

	Harness h(protocol::Role::Host, "host-1", 1000);
	h.manager->start_capture();

	protocol::OutgoingFile file;
	file.name = "a.txt";
	file.data.assign(100, 'x');

	protocol::SendReport report = h.manager->send_file(file);
	check(report.complete_sent == 0 && h.notice_count("File not sent") == 1, "nobody to send to");

	auto channel = connect_controller(h, "ctl-1");
	check(channel && channel->is_open(), "controller connected");
	if (!channel) return;
	size_t before = channel->sent.size();
	report = h.manager->send_file(file);
	check(report.total_chunks == 1 && report.complete_sent == 1, "file sent to the connected controller");
	check(channel->sent.size() == before + 3, "meta, chunk and complete on the channel");

	protocol::OutgoingFile big;
	big.name = "big.bin";
	big.data.assign(2000, 'y');
	report = h.manager->send_file(big);
	check(report.total_chunks == 0 && h.notice_count("File too large") == 1, "file over the limit refused");

	channel->remote_close();
	h.loop.run_pending();
	before = channel->sent.size();
	report = h.manager->send_file(file, "ctl-1");
	check(report.meta_sent == 0 && channel->sent.size() == before, "closed channel gets nothing");
	check(h.notice_count("File not sent") == 2, "undelivered file raises a notice");
	check(!h.manager->snapshot("ctl-1")->channel_open, "snapshot shows the closed channel");
}

static size_t count_frames(const FakeChannel &channel, const std::string &type)
{
	size_t n = 0;
	for (const auto &frame : channel.sent) {
		if (contains(frame, "\"type\":\"" + type + "\"")) n++;
	}
	return n;
}

static void test_buffered_channel()
{
	printf("\n=== Buffered channel ===\n");

	Harness ctl(protocol::Role::Controller, "ctl-1");
	ctl.manager->handle_signal(record("participant",
		{{"userId", "host-1"}, {"role", "host"}, {"status", "joined"}}, "host-1"));
	std::shared_ptr<FakeLink> link = ctl.factory.latest("host-1");
	check(link && link->channel, "offering link with a control channel");
	if (!link || !link->channel) return;

	link->channel->buffer_sends = true;
	ctl.manager->send_control("host-1", protocol::Clipboard{"one"});
	ctl.manager->send_control("host-1", protocol::Clipboard{"two"});
	ctl.manager->send_control("host-1", protocol::Clipboard{"three"});
	link->channel->open();
	ctl.loop.run_pending();
	check(count_frames(*link->channel, "clipboard") == 3, "whole outbox flushed while the channel buffers");
	check(!link->channel->sent.empty() && contains(link->channel->sent.back(), "three"), "flushed in order");
	check(ctl.manager->send_control("host-1", protocol::Clipboard{"four"}), "buffered send counts as sent");

	Harness h(protocol::Role::Host, "host-1");
	h.manager->start_capture();
	auto channel = connect_controller(h, "ctl-1");
	check(channel != nullptr, "controller connected");
	if (!channel) return;
	channel->buffer_sends = true;
	size_t timers = h.loop.timer_count();

	protocol::OutgoingFile file;
	file.name = "video.bin";
	file.data.assign(40 * protocol::FILE_CHUNK_SIZE, 'v');
	protocol::SendReport report = h.manager->send_file(file);
	check(report.total_chunks == 40 && report.meta_sent == 1, "meta accepted");
	check(report.chunks_sent > 0 && report.chunks_sent < 40 && report.complete_sent == 0,
	      "chunks pause once the channel backs up");
	check(h.manager->outgoing_file_count() == 1 && h.loop.timer_count() == timers + 1, "paused send kept with a timer");
	check(h.notice_count("File not sent") == 0, "buffering is not a failure");

	size_t paused_at = count_frames(*channel, "file-chunk");
	h.loop.advance(std::chrono::milliseconds(40));
	check(count_frames(*channel, "file-chunk") == paused_at, "nothing more while still backed up");

	for (int i = 0; i < 20 && h.manager->outgoing_file_count() > 0; i++) {
		channel->drain();
		h.loop.advance(webrtc::PeerConnectionManager::FILE_PUMP_INTERVAL);
	}
	check(h.manager->outgoing_file_count() == 0, "send resumed and finished");
	check(count_frames(*channel, "file-chunk") == 40 && count_frames(*channel, "file-complete") == 1,
	      "every chunk and the complete went out");
	check(contains(channel->sent.back(), "file-complete"), "complete goes last");
	check(h.notice_count("File not sent") == 0 && h.loop.timer_count() == timers, "no notice, timer released");

	// Link lost mid-file: the send finishes with a notice
	channel->drain();
	report = h.manager->send_file(file);
	check(h.manager->outgoing_file_count() == 1, "second file paused");
	h.manager->teardown_link("ctl-1");
	h.loop.advance(webrtc::PeerConnectionManager::FILE_PUMP_INTERVAL);
	check(h.manager->outgoing_file_count() == 0 && h.notice_count("File not sent") == 1,
	      "recipient gone, file abandoned with a notice");

	Harness s(protocol::Role::Host, "host-1");
	s.manager->start_capture();
	auto backed_up = connect_controller(s, "ctl-1");
	if (!backed_up) return;
	backed_up->buffer_sends = true;
	s.manager->send_file(file);
	check(s.manager->outgoing_file_count() == 1, "file paused before shutdown");
	s.manager->shutdown();
	check(s.manager->outgoing_file_count() == 0 && s.loop.timer_count() == 0, "shutdown drops the paused file and its timer");
}

static void test_non_utf8_text()
{
	printf("\n=== Text that is not UTF-8 ===\n");

	Harness h(protocol::Role::Host, "host-1");
	h.manager->start_capture();
	auto channel = connect_controller(h, "ctl-1");
	check(channel != nullptr, "controller connected");
	if (!channel) return;

	size_t sent = h.manager->broadcast_control(protocol::Clipboard{"caf\xe9"});
	check(sent == 1, "Latin-1 clipboard still sent");
	check(contains(channel->sent.back(), "caf\xEF\xBF\xBD"), "invalid byte replaced with U+FFFD");

	protocol::OutgoingFile file;
	file.name = "r\xe9sum\xe9.txt";
	file.data.assign(10, 'r');
	protocol::SendReport report = h.manager->send_file(file);
	check(report.complete_sent == 1, "file with a Latin-1 name sent");
}

static void test_shutdown()
{
	printf("\n=== Shutdown ===\n");

	Harness h(protocol::Role::Host, "host-1");
	h.manager->start_capture();
	connect_controller(h, "ctl-1");
	connect_controller(h, "ctl-2");
	check(h.manager->link_count() == 2 && h.loop.timer_count() == 3, "two monitors and the transfer sweep");

	h.manager->teardown_link("ctl-1");
	h.manager->teardown_link("ctl-1");
	h.manager->teardown_link("nobody");
	check(h.manager->link_count() == 1, "teardown is idempotent");

	h.manager->shutdown();
	check(h.manager->link_count() == 0, "shutdown closes every link");
	check(h.loop.timer_count() == 0, "no timers left");
	check(h.factory.latest("ctl-2")->closed, "transport closed on shutdown");
}

int main()
{
	printf("=== test_peer_connection_manager - link orchestration ===\n");

	test_controller_offer_flow();
	test_host_queues_offers();
	test_host_rejections();
	test_file_sends();
	test_buffered_channel();
	test_non_utf8_text();
	test_shutdown();

	bool passed = failures == 0;
	if (passed) {
		printf("\n*** PASS: peer connection manager ***\n");
	} else {
		printf("\n*** FAIL: %d check(s) failed ***\n", failures);
	}
	return passed ? 0 : 1;
}
