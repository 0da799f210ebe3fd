/*
 * desklink-host
 *
 * Joins a session through the signaling relay and keeps one peer link per
 * remote participant. A host shares its screen (synthetic test pattern
 * and tone) and takes remote input through the control adapter; a
 * controller receives the stream and sends clipboard and files.
 *
 * Commands are read from stdin, one per line (see "help").
 */

#include "config/host_config.h"
#include "control/adapter_selector.h"
#include "event/event_loop.h"
#include "media/test_pattern.h"
#include "signaling/websocket_signaling.h"
#include "utils/notice.h"
#include "webrtc/peer_connection_manager.h"
#include "webrtc/rtc_link_transport.h"
#include <rtc/rtc.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fstream>
#include <future>
#include <iterator>
#include <poll.h>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

static std::atomic<bool> g_running{true};
static std::atomic<bool> g_sharing{false};

static void signal_handler(int sig) {
    (void)sig;
    g_running = false;
}

// Keep only the last path component of a name a peer sent us
static std::string safe_file_name(const std::string& name) {
    size_t slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
    if (base.empty() || base == "." || base == "..") {
        base = "received.bin";
    }
    return base;
}

static bool write_received_file(const std::string& dir, const protocol::ReceivedFile& file) {
    std::string base = safe_file_name(file.name);
    std::string path = dir + "/" + base;

    // Never overwrite: name (1), name (2), ...
    struct stat st;
    for (int n = 1; stat(path.c_str(), &st) == 0; n++) {
        path = dir + "/" + base + " (" + std::to_string(n) + ")";
    }

    FILE* out = fopen(path.c_str(), "wb");
    if (!out) {
        fprintf(stderr, "[Host] Cannot write %s: %s\n", path.c_str(), strerror(errno));
        return false;
    }
    size_t written = fwrite(file.data.data(), 1, file.data.size(), out);
    bool ok = written == file.data.size();
    if (fclose(out) != 0) ok = false;

    if (!ok) {
        fprintf(stderr, "[Host] Short write to %s\n", path.c_str());
        return false;
    }
    fprintf(stderr, "[Host] Saved %s from %s (%zu bytes)\n", path.c_str(), file.from_id.c_str(), file.data.size());
    return true;
}

static bool read_file(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

static void print_snapshot(const webrtc::LinkSnapshot& snap) {
    fprintf(stderr, "%s: %s, indicator %s, signaling %s, channel %s\n",
            snap.remote_id.c_str(), webrtc::link_state_name(snap.state),
            webrtc::indicator_name(snap.indicator), webrtc::signaling_state_name(snap.signaling),
            snap.channel_open ? "open" : "closed");
    fprintf(stderr, "  preset %s (%s), auto-adjust %s, media out=%s in=%s\n",
            snap.preset_key.c_str(), snap.preset_name.c_str(), snap.auto_adjust ? "on" : "off",
            snap.outgoing_media ? "yes" : "no", snap.incoming_media ? "yes" : "no");
    if (snap.stats) {
        fprintf(stderr, "  rtt %.0f ms, jitter %.1f ms, loss %.2f%%, bandwidth %.0f kbps\n",
                snap.stats->round_trip_ms, snap.stats->jitter_ms,
                snap.stats->packet_loss_rate, snap.stats->bandwidth_bps / 1000.0);
    }
    if (snap.quality) {
        fprintf(stderr, "  quality %d (%s)", snap.quality->score,
                quality::category_name(snap.quality->category));
        if (snap.average_quality) {
            fprintf(stderr, ", average %d", snap.average_quality->score);
        }
        for (const auto& issue : snap.quality->issues) {
            fprintf(stderr, ", %s", issue.c_str());
        }
        fprintf(stderr, "\n");
    }
}

static void print_help() {
    fprintf(stderr,
            "Commands:\n"
            "  share | unshare               Start/stop screen sharing (host)\n"
            "  offer <peer>                  Connect to a peer\n"
            "  leave <peer>                  Close the link to a peer\n"
            "  status [peer]                 Link state and quality\n"
            "  preset <peer> <key>           Switch preset (ultra high medium low minimal)\n"
            "  force <peer> <key>            Switch preset and stop adapting\n"
            "  auto <peer> on|off            Toggle quality adaptation\n"
            "  control on|off                Allow remote control\n"
            "  clipboard <text>              Share clipboard text\n"
            "  send <peer|*> <path>          Send a file\n"
            "  quit\n");
}

// Synthetic capture: test pattern at the configured rate plus a 20ms tone
static void capture_loop(webrtc::PeerConnectionManager& manager, int width, int height, int fps) {
    std::vector<uint8_t> frame(static_cast<size_t>(width) * height * 4);
    media::ToneGenerator tone;
    int frame_num = 0;

    auto start = std::chrono::steady_clock::now();
    auto next_video = start;
    auto next_audio = start;
    const auto video_interval = std::chrono::microseconds(1000000 / fps);
    const auto audio_interval = std::chrono::milliseconds(AUDIO_FRAME_DURATION_MS);

    while (g_running) {
        auto now = std::chrono::steady_clock::now();
        if (g_sharing) {
            if (now >= next_video) {
                media::generate_test_frame(frame.data(), width, height, frame_num++);
                uint64_t ts = std::chrono::duration_cast<std::chrono::microseconds>(now - start).count();
                manager.push_video_frame(frame.data(), width, height, width * 4, ts);
                next_video += video_interval;
                if (next_video < now) next_video = now + video_interval;
            }
            if (now >= next_audio) {
                std::vector<int16_t> pcm = tone.generate_frame();
                manager.push_audio_frame(pcm.data(), AUDIO_FRAME_SIZE);
                next_audio += audio_interval;
                if (next_audio < now) next_audio = now + audio_interval;
            }
        } else {
            next_video = now;
            next_audio = now;
        }
        std::this_thread::sleep_until(std::min(next_video, next_audio) + std::chrono::microseconds(100));
        if (!g_sharing) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

static void handle_command(const std::string& line, webrtc::PeerConnectionManager& manager,
                           const config::HostConfig& config) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    if (cmd.empty()) return;

    if (cmd == "help") {
        print_help();
    } else if (cmd == "quit" || cmd == "exit") {
        g_running = false;
    } else if (cmd == "share") {
        if (manager.start_capture()) g_sharing = true;
    } else if (cmd == "unshare") {
        g_sharing = false;
        manager.stop_capture();
    } else if (cmd == "offer") {
        std::string peer;
        in >> peer;
        if (peer.empty()) { fprintf(stderr, "usage: offer <peer>\n"); return; }
        manager.create_and_send_offer(peer);
    } else if (cmd == "leave") {
        std::string peer;
        in >> peer;
        manager.teardown_link(peer, "left");
    } else if (cmd == "status") {
        std::string peer;
        in >> peer;
        std::vector<std::string> ids = peer.empty() ? manager.link_ids() : std::vector<std::string>{peer};
        fprintf(stderr, "%s: %zu link(s), %zu queued offer(s), sharing %s, control %s\n",
                config.self_id.c_str(), manager.link_count(), manager.pending_offer_count(),
                manager.capture_active() ? "on" : "off",
                manager.dispatcher().control_enabled() ? "on" : "off");
        for (const auto& id : ids) {
            if (auto snap = manager.snapshot(id)) {
                print_snapshot(*snap);
            } else {
                fprintf(stderr, "%s: no link\n", id.c_str());
            }
        }
    } else if (cmd == "preset" || cmd == "force") {
        std::string peer, key;
        in >> peer >> key;
        bool ok = cmd == "preset" ? manager.set_preset(peer, key) : manager.force_preset(peer, key);
        if (!ok) fprintf(stderr, "%s: unknown peer or preset\n", cmd.c_str());
    } else if (cmd == "auto") {
        std::string peer, value;
        in >> peer >> value;
        if (!manager.set_auto_adjust(peer, value == "on")) fprintf(stderr, "auto: unknown peer\n");
    } else if (cmd == "control") {
        std::string value;
        in >> value;
        manager.set_control_enabled(value == "on");
        fprintf(stderr, "Remote control %s\n", value == "on" ? "enabled" : "disabled");
    } else if (cmd == "clipboard") {
        std::string text;
        std::getline(in >> std::ws, text);
        size_t sent = manager.broadcast_control(protocol::Clipboard{text});
        fprintf(stderr, "Clipboard sent to %zu peer(s)\n", sent);
    } else if (cmd == "send") {
        std::string peer, path;
        in >> peer;
        std::getline(in >> std::ws, path);
        protocol::OutgoingFile file;
        if (path.empty() || !read_file(path, file.data)) {
            fprintf(stderr, "send: cannot read '%s'\n", path.c_str());
            return;
        }
        file.name = safe_file_name(path);
        file.mime = "application/octet-stream";
        manager.send_file(file, peer == "*" ? "" : peer);
    } else {
        fprintf(stderr, "Unknown command '%s' (try help)\n", cmd.c_str());
    }
}

int main(int argc, char* argv[]) {
    config::HostConfig config;
    std::string config_path = config::find_config_path(argc, argv);
    if (!config_path.empty() && !config.load_from_file(config_path)) {
        return 1;
    }
    config.load_from_env();
    config.parse_command_line(argc, argv);
    if (!config.validate()) {
        return 1;
    }
    config.print_summary();

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    rtc::InitLogger(config.debug_connection ? rtc::LogLevel::Info : rtc::LogLevel::Error);
    rtc::Preload();

    protocol::Role role = protocol::parse_role(config.role).value_or(protocol::Role::Host);

    notice::NoticeCallback notify = [](notice::Level level, const std::string& title, const std::string& text) {
        fprintf(stderr, "[Host] (%s) %s: %s\n", notice::level_name(level), title.c_str(), text.c_str());
    };

    event::ThreadLoop loop;
    signaling::WebSocketSignaling signaling(config.self_id, config.role, config.session_id,
                                            config.debug_connection);
    webrtc::RtcTransportFactory factory(config.ice_servers, role, config.debug_connection);
    webrtc::PeerConnectionManager manager(loop, signaling, factory,
                                          config::make_manager_settings(config), notify);

    std::unique_ptr<control::ControlAdapter> adapter;
    if (role == protocol::Role::Host) {
        adapter = control::select_control_adapter(config::make_adapter_options(config), notify);
        manager.dispatcher().set_adapter(adapter.get());
    }

    std::string download_dir = config.download_dir;
    manager.dispatcher().set_file_sink([download_dir](const protocol::ReceivedFile& file) {
        write_received_file(download_dir, file);
    });
    manager.dispatcher().set_clipboard_sink([](const std::string& from, const std::string& content) {
        fprintf(stderr, "[Host] Clipboard from %s: %s\n", from.c_str(), content.c_str());
    });
    manager.on_indicator_change([](const std::string& remote_id, webrtc::Indicator indicator) {
        fprintf(stderr, "[Host] %s: %s\n", remote_id.c_str(), webrtc::indicator_name(indicator));
    });

    signaling.on_record([&loop, &manager](const signaling::SignalRecord& record) {
        loop.post([&manager, record]() { manager.handle_signal(record); });
    });

    loop.post([&manager]() { manager.start(); });
    if (role == protocol::Role::Host && config.capture_autostart) {
        loop.post([&manager]() {
            if (manager.start_capture()) g_sharing = true;
        });
    }
    loop.start();

    if (!signaling.connect(config.signaling_url)) {
        loop.stop();
        return 1;
    }

    std::thread capture;
    if (role == protocol::Role::Host && config.test_pattern) {
        capture = std::thread(capture_loop, std::ref(manager), config.width, config.height, config.fps);
    }

    fprintf(stderr, "[Host] Ready. Type 'help' for commands.\n");

    // stdin commands, polled so a signal can end the loop
    std::string pending;
    bool stdin_open = true;
    while (g_running) {
        if (!stdin_open) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            continue;
        }
        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0) continue;

        char buf[1024];
        ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
        if (n <= 0) {
            stdin_open = false;     // daemon mode: keep running until a signal
            continue;
        }
        pending.append(buf, static_cast<size_t>(n));

        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            std::promise<void> done;
            auto finished = done.get_future();
            loop.post([&line, &manager, &config, &done]() {
                try {
                    handle_command(line, manager, config);
                } catch (const std::exception& e) {
                    fprintf(stderr, "[Host] Command failed: %s\n", e.what());
                }
                done.set_value();
            });
            finished.wait();
        }
    }

    fprintf(stderr, "\n[Host] Shutting down...\n");
    g_sharing = false;
    if (capture.joinable()) {
        capture.join();
    }

    std::promise<void> stopped;
    auto torn_down = stopped.get_future();
    loop.post([&manager, &stopped]() {
        manager.shutdown();
        stopped.set_value();
    });
    torn_down.wait_for(std::chrono::seconds(5));
    loop.stop();

    signaling.disconnect();
    if (adapter) {
        adapter->destroy();
    }
    return 0;
}
