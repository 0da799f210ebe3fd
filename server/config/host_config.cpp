/*
 * Host Configuration Implementation
 */

#include "host_config.h"
#include "../quality/quality_preset.h"
#include "../utils/json_utils.h"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <random>

namespace config {

namespace {

bool env_flag(const char* name) {
    const char* value = getenv(name);
    return value && *value && strcmp(value, "0") != 0;
}

void env_string(const char* name, std::string& target) {
    const char* value = getenv(name);
    if (value && *value) {
        target = value;
    }
}

bool parse_on_off(const char* text, bool& out) {
    if (strcmp(text, "on") == 0 || strcmp(text, "true") == 0 || strcmp(text, "1") == 0) {
        out = true;
        return true;
    }
    if (strcmp(text, "off") == 0 || strcmp(text, "false") == 0 || strcmp(text, "0") == 0) {
        out = false;
        return true;
    }
    return false;
}

std::string random_suffix() {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::mt19937 rng(static_cast<uint32_t>(
        std::chrono::steady_clock::now().time_since_epoch().count()));
    std::string suffix;
    for (int i = 0; i < 6; i++) {
        suffix += digits[rng() % 36];
    }
    return suffix;
}

} // namespace

bool HostConfig::load_from_file(const std::string& path) {
    try {
        auto j = json_utils::parse_file(path);
        if (!j.is_object()) {
            fprintf(stderr, "[Config] %s: top level is not an object\n", path.c_str());
            return false;
        }

        if (j.contains("self_id")) self_id = json_utils::get_string(j, "self_id");
        if (j.contains("role")) role = json_utils::get_string(j, "role", role);
        if (j.contains("session_id")) session_id = json_utils::get_string(j, "session_id", session_id);
        if (j.contains("signaling_url")) signaling_url = json_utils::get_string(j, "signaling_url", signaling_url);
        if (j.contains("ice_servers")) ice_servers = json_utils::get_string_array(j, "ice_servers");

        if (j.contains("agent_socket")) agent_socket = json_utils::get_string(j, "agent_socket", agent_socket);
        if (j.contains("agent_connect_timeout_ms")) agent_connect_timeout_ms = json_utils::get_int(j, "agent_connect_timeout_ms", agent_connect_timeout_ms);
        if (j.contains("allow_clipboard")) allow_clipboard = json_utils::get_bool(j, "allow_clipboard", allow_clipboard);
        if (j.contains("control_enabled")) control_enabled = json_utils::get_bool(j, "control_enabled", control_enabled);

        if (j.contains("initial_preset")) initial_preset = json_utils::get_string(j, "initial_preset", initial_preset);
        if (j.contains("auto_adjust")) auto_adjust = json_utils::get_bool(j, "auto_adjust", auto_adjust);
        if (j.contains("adjust_cooldown_ms")) adjust_cooldown_ms = json_utils::get_int(j, "adjust_cooldown_ms", adjust_cooldown_ms);
        if (j.contains("sample_interval_ms")) sample_interval_ms = json_utils::get_int(j, "sample_interval_ms", sample_interval_ms);
        if (j.contains("quality_history_size")) quality_history_size = json_utils::get_int(j, "quality_history_size", quality_history_size);

        if (j.contains("transfer_expiry_ms")) transfer_expiry_ms = json_utils::get_int(j, "transfer_expiry_ms", transfer_expiry_ms);
        if (j.contains("max_file_size_mb")) max_file_size_mb = json_utils::get_int(j, "max_file_size_mb", max_file_size_mb);
        if (j.contains("max_pending_transfer_mb")) max_pending_transfer_mb = json_utils::get_int(j, "max_pending_transfer_mb", max_pending_transfer_mb);
        if (j.contains("download_dir")) download_dir = json_utils::get_string(j, "download_dir", download_dir);

        if (j.contains("test_pattern")) test_pattern = json_utils::get_bool(j, "test_pattern", test_pattern);
        if (j.contains("capture_autostart")) capture_autostart = json_utils::get_bool(j, "capture_autostart", capture_autostart);
        if (j.contains("width")) width = json_utils::get_int(j, "width", width);
        if (j.contains("height")) height = json_utils::get_int(j, "height", height);
        if (j.contains("fps")) fps = json_utils::get_int(j, "fps", fps);

        if (j.contains("debug_connection")) debug_connection = json_utils::get_bool(j, "debug_connection");
        if (j.contains("debug_quality")) debug_quality = json_utils::get_bool(j, "debug_quality");
        if (j.contains("debug_input")) debug_input = json_utils::get_bool(j, "debug_input");
        if (j.contains("debug_transfer")) debug_transfer = json_utils::get_bool(j, "debug_transfer");
    } catch (const std::exception& e) {
        fprintf(stderr, "[Config] Failed to load %s: %s\n", path.c_str(), e.what());
        return false;
    }

    fprintf(stderr, "[Config] Loaded %s\n", path.c_str());
    return true;
}

void HostConfig::load_from_env() {
    // Debug flags from environment
    if (env_flag("DESKLINK_DEBUG_CONNECTION")) {
        debug_connection = true;
    }
    if (env_flag("DESKLINK_DEBUG_QUALITY")) {
        debug_quality = true;
    }
    if (env_flag("DESKLINK_DEBUG_INPUT")) {
        debug_input = true;
    }
    if (env_flag("DESKLINK_DEBUG_TRANSFER")) {
        debug_transfer = true;
    }

    env_string("DESKLINK_SELF_ID", self_id);
    env_string("DESKLINK_ROLE", role);
    env_string("DESKLINK_SESSION_ID", session_id);
    env_string("DESKLINK_SIGNALING_URL", signaling_url);
    env_string("DESKLINK_AGENT_SOCKET", agent_socket);
    env_string("DESKLINK_DOWNLOAD_DIR", download_dir);
}

void HostConfig::parse_command_line(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"help",             no_argument,       0, 'h'},
        {"config",           required_argument, 0, 'c'},
        {"id",               required_argument, 0, 'i'},
        {"role",             required_argument, 0, 'r'},
        {"session",          required_argument, 0, 'S'},
        {"signaling",        required_argument, 0, 's'},
        {"share",            no_argument,       0, 'a'},
        {"ice-server",       required_argument, 0,  0 },
        {"no-ice-servers",   no_argument,       0,  0 },
        {"agent-socket",     required_argument, 0,  0 },
        {"agent-timeout",    required_argument, 0,  0 },
        {"clipboard",        required_argument, 0,  0 },
        {"control",          required_argument, 0,  0 },
        {"preset",           required_argument, 0,  0 },
        {"auto-adjust",      required_argument, 0,  0 },
        {"cooldown",         required_argument, 0,  0 },
        {"sample-interval",  required_argument, 0,  0 },
        {"transfer-expiry",  required_argument, 0,  0 },
        {"max-file-size",    required_argument, 0,  0 },
        {"max-pending",      required_argument, 0,  0 },
        {"download-dir",     required_argument, 0,  0 },
        {"no-test-pattern",  no_argument,       0,  0 },
        {"width",            required_argument, 0,  0 },
        {"height",           required_argument, 0,  0 },
        {"fps",              required_argument, 0,  0 },
        {"debug-connection", no_argument,       0,  0 },
        {"debug-quality",    no_argument,       0,  0 },
        {"debug-input",      no_argument,       0,  0 },
        {"debug-transfer",   no_argument,       0,  0 },
        {0, 0, 0, 0}
    };

    bool ice_from_command_line = false;
    int option_index = 0;
    int c;
    optind = 1;

    while ((c = getopt_long(argc, argv, "hc:i:r:S:s:a", long_options, &option_index)) != -1) {
        switch (c) {
            case 0: {
                // Long option
                const char* name = long_options[option_index].name;
                if (strcmp(name, "ice-server") == 0) {
                    if (!ice_from_command_line) {
                        ice_servers.clear();
                        ice_from_command_line = true;
                    }
                    ice_servers.push_back(optarg);
                } else if (strcmp(name, "no-ice-servers") == 0) {
                    ice_servers.clear();
                    ice_from_command_line = true;
                } else if (strcmp(name, "agent-socket") == 0) {
                    agent_socket = optarg;
                } else if (strcmp(name, "agent-timeout") == 0) {
                    agent_connect_timeout_ms = atoi(optarg);
                } else if (strcmp(name, "clipboard") == 0) {
                    if (!parse_on_off(optarg, allow_clipboard)) {
                        fprintf(stderr, "--clipboard expects on or off\n");
                        exit(1);
                    }
                } else if (strcmp(name, "control") == 0) {
                    if (!parse_on_off(optarg, control_enabled)) {
                        fprintf(stderr, "--control expects on or off\n");
                        exit(1);
                    }
                } else if (strcmp(name, "preset") == 0) {
                    initial_preset = optarg;
                } else if (strcmp(name, "auto-adjust") == 0) {
                    if (!parse_on_off(optarg, auto_adjust)) {
                        fprintf(stderr, "--auto-adjust expects on or off\n");
                        exit(1);
                    }
                } else if (strcmp(name, "cooldown") == 0) {
                    adjust_cooldown_ms = atoi(optarg);
                } else if (strcmp(name, "sample-interval") == 0) {
                    sample_interval_ms = atoi(optarg);
                } else if (strcmp(name, "transfer-expiry") == 0) {
                    transfer_expiry_ms = atoi(optarg);
                } else if (strcmp(name, "max-file-size") == 0) {
                    max_file_size_mb = atoi(optarg);
                } else if (strcmp(name, "max-pending") == 0) {
                    max_pending_transfer_mb = atoi(optarg);
                } else if (strcmp(name, "download-dir") == 0) {
                    download_dir = optarg;
                } else if (strcmp(name, "no-test-pattern") == 0) {
                    test_pattern = false;
                } else if (strcmp(name, "width") == 0) {
                    width = atoi(optarg);
                } else if (strcmp(name, "height") == 0) {
                    height = atoi(optarg);
                } else if (strcmp(name, "fps") == 0) {
                    fps = atoi(optarg);
                } else if (strcmp(name, "debug-connection") == 0) {
                    debug_connection = true;
                } else if (strcmp(name, "debug-quality") == 0) {
                    debug_quality = true;
                } else if (strcmp(name, "debug-input") == 0) {
                    debug_input = true;
                } else if (strcmp(name, "debug-transfer") == 0) {
                    debug_transfer = true;
                }
                break;
            }

            case 'h':
                print_usage(argv[0]);
                exit(0);

            case 'c':
                // Loaded before the environment; see find_config_path()
                break;

            case 'i':
                self_id = optarg;
                break;

            case 'r':
                role = optarg;
                break;

            case 'S':
                session_id = optarg;
                break;

            case 's':
                signaling_url = optarg;
                break;

            case 'a':
                capture_autostart = true;
                break;

            case '?':
                // Error message already printed by getopt_long
                exit(1);

            default:
                fprintf(stderr, "Unknown option\n");
                exit(1);
        }
    }
}

bool HostConfig::validate() {
    bool ok = true;

    if (!protocol::parse_role(role)) {
        fprintf(stderr, "[Config] Invalid role '%s' (expected host or controller)\n", role.c_str());
        ok = false;
    }
    if (!quality::preset_index(initial_preset)) {
        fprintf(stderr, "[Config] Unknown preset '%s'\n", initial_preset.c_str());
        ok = false;
    }
    if (sample_interval_ms <= 0 || adjust_cooldown_ms < 0 || quality_history_size <= 0) {
        fprintf(stderr, "[Config] Quality intervals must be positive\n");
        ok = false;
    }
    if (transfer_expiry_ms <= 0 || max_file_size_mb <= 0 || max_pending_transfer_mb < max_file_size_mb) {
        fprintf(stderr, "[Config] Transfer expiry and max file size must be positive, "
                        "and max pending at least the max file size\n");
        ok = false;
    }
    if (width < 16 || height < 16 || fps <= 0 || fps > 120) {
        fprintf(stderr, "[Config] Invalid capture size %dx%d @ %d fps\n", width, height, fps);
        ok = false;
    }
    if (agent_connect_timeout_ms < 0) {
        agent_connect_timeout_ms = 0;
    }

    if (self_id.empty() && ok) {
        self_id = role + "-" + random_suffix();
    }
    return ok;
}

void HostConfig::print_summary() const {
    fprintf(stderr, "\n=== desklink-host ===\n");
    fprintf(stderr, "Participant:      %s (%s)\n", self_id.c_str(), role.c_str());
    fprintf(stderr, "Session:          %s\n", session_id.c_str());
    fprintf(stderr, "Signaling:        %s\n", signaling_url.c_str());
    if (ice_servers.empty()) {
        fprintf(stderr, "ICE servers:      none (LAN only)\n");
    }
    for (const auto& server : ice_servers) {
        fprintf(stderr, "ICE server:       %s\n", server.c_str());
    }

    fprintf(stderr, "\nRemote control:\n");
    fprintf(stderr, "  Control:        %s\n", control_enabled ? "enabled" : "disabled");
    fprintf(stderr, "  Clipboard:      %s\n", allow_clipboard ? "shared" : "not shared");
    if (role == "host") {
        fprintf(stderr, "  Agent socket:   %s (connect %d ms)\n", agent_socket.c_str(), agent_connect_timeout_ms);
    }

    fprintf(stderr, "\nQuality:\n");
    fprintf(stderr, "  Initial preset: %s\n", initial_preset.c_str());
    fprintf(stderr, "  Auto-adjust:    %s (cooldown %d ms)\n", auto_adjust ? "on" : "off", adjust_cooldown_ms);
    fprintf(stderr, "  Sampling:       every %d ms, %d samples kept\n", sample_interval_ms, quality_history_size);

    fprintf(stderr, "\nFiles:\n");
    fprintf(stderr, "  Download dir:   %s\n", download_dir.c_str());
    fprintf(stderr, "  Max size:       %d MB (stalled transfers dropped after %d ms)\n",
            max_file_size_mb, transfer_expiry_ms);
    fprintf(stderr, "  Max pending:    %d MB across incoming transfers\n", max_pending_transfer_mb);

    if (role == "host") {
        fprintf(stderr, "\nCapture:          %dx%d @ %d fps, %s%s\n", width, height, fps,
                test_pattern ? "test pattern" : "external",
                capture_autostart ? ", sharing at start" : "");
    }

    // Show active debug flags
    bool any_debug = debug_connection || debug_quality || debug_input || debug_transfer;
    if (any_debug) {
        fprintf(stderr, "\nDebug flags:\n");
        if (debug_connection) fprintf(stderr, "  - Connection (signaling/ICE/state)\n");
        if (debug_quality)    fprintf(stderr, "  - Quality (per-tick stats)\n");
        if (debug_input)      fprintf(stderr, "  - Input (control messages)\n");
        if (debug_transfer)   fprintf(stderr, "  - File transfer (chunks)\n");
    }

    fprintf(stderr, "\n");
}

void HostConfig::print_usage(const char* program_name) const {
    fprintf(stderr, "Usage: %s [options]\n\n", program_name);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  -h, --help                 Show this help\n");
    fprintf(stderr, "  -c, --config FILE          JSON config file\n");
    fprintf(stderr, "  -i, --id ID                Participant id (default: generated)\n");
    fprintf(stderr, "  -r, --role ROLE            host or controller (default: %s)\n", role.c_str());
    fprintf(stderr, "  -S, --session ID           Session id (default: %s)\n", session_id.c_str());
    fprintf(stderr, "  -s, --signaling URL        Signaling WebSocket URL (default: %s)\n", signaling_url.c_str());
    fprintf(stderr, "  -a, --share                Start screen sharing immediately (host)\n");
    fprintf(stderr, "      --ice-server URL       ICE server, repeatable (default: Google STUN)\n");
    fprintf(stderr, "      --no-ice-servers       Use host candidates only\n");
    fprintf(stderr, "      --agent-socket PATH    Input agent socket (default: %s)\n", agent_socket.c_str());
    fprintf(stderr, "      --agent-timeout MS     Agent connect timeout (default: %d)\n", agent_connect_timeout_ms);
    fprintf(stderr, "      --clipboard on|off     Share clipboard (default: on)\n");
    fprintf(stderr, "      --control on|off       Allow remote control (default: on)\n");
    fprintf(stderr, "      --preset KEY           Initial preset: ultra high medium low minimal\n");
    fprintf(stderr, "      --auto-adjust on|off   Adapt quality to the network (default: on)\n");
    fprintf(stderr, "      --cooldown MS          Minimum time between adjustments (default: %d)\n", adjust_cooldown_ms);
    fprintf(stderr, "      --sample-interval MS   Quality sampling interval (default: %d)\n", sample_interval_ms);
    fprintf(stderr, "      --transfer-expiry MS   Drop stalled incoming files after (default: %d)\n", transfer_expiry_ms);
    fprintf(stderr, "      --max-file-size MB     Largest file sent or accepted (default: %d)\n", max_file_size_mb);
    fprintf(stderr, "      --max-pending MB       Incoming transfers in progress, combined (default: %d)\n", max_pending_transfer_mb);
    fprintf(stderr, "      --download-dir PATH    Where received files are written (default: %s)\n", download_dir.c_str());
    fprintf(stderr, "      --no-test-pattern      Do not run the synthetic capture source\n");
    fprintf(stderr, "      --width N --height N --fps N   Capture geometry\n");
    fprintf(stderr, "      --debug-connection     Signaling/ICE/state logs\n");
    fprintf(stderr, "      --debug-quality        Per-tick quality logs\n");
    fprintf(stderr, "      --debug-input          Control message logs\n");
    fprintf(stderr, "      --debug-transfer       File transfer logs\n");
    fprintf(stderr, "\nEnvironment variables:\n");
    fprintf(stderr, "  DESKLINK_DEBUG_CONNECTION  Enable signaling/ICE/state debug logs\n");
    fprintf(stderr, "  DESKLINK_DEBUG_QUALITY     Enable per-tick quality logs\n");
    fprintf(stderr, "  DESKLINK_DEBUG_INPUT       Enable control message logs\n");
    fprintf(stderr, "  DESKLINK_DEBUG_TRANSFER    Enable file transfer logs\n");
    fprintf(stderr, "  DESKLINK_SELF_ID, DESKLINK_ROLE, DESKLINK_SESSION_ID,\n");
    fprintf(stderr, "  DESKLINK_SIGNALING_URL, DESKLINK_AGENT_SOCKET, DESKLINK_DOWNLOAD_DIR\n");
    fprintf(stderr, "\n");
}

std::string find_config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if ((strcmp(argv[i], "--config") == 0 || strcmp(argv[i], "-c") == 0) && i + 1 < argc) {
            return argv[i + 1];
        }
        if (strncmp(argv[i], "--config=", 9) == 0) {
            return argv[i] + 9;
        }
    }
    return "";
}

webrtc::ManagerSettings make_manager_settings(const HostConfig& config) {
    webrtc::ManagerSettings settings;
    settings.self_id = config.self_id;
    settings.role = protocol::parse_role(config.role).value_or(protocol::Role::Host);

    settings.bitrate.initial_preset = config.initial_preset;
    settings.bitrate.auto_adjust = config.auto_adjust;
    settings.bitrate.cooldown = std::chrono::milliseconds(config.adjust_cooldown_ms);

    settings.monitor.interval = std::chrono::milliseconds(config.sample_interval_ms);
    settings.monitor.history_size = static_cast<size_t>(config.quality_history_size);
    settings.monitor.debug = config.debug_quality;

    settings.dispatcher.control_enabled = config.control_enabled;
    settings.dispatcher.allow_clipboard = config.allow_clipboard;
    settings.dispatcher.max_file_size = static_cast<uint64_t>(config.max_file_size_mb) * 1024 * 1024;
    settings.dispatcher.max_pending_bytes = static_cast<uint64_t>(config.max_pending_transfer_mb) * 1024 * 1024;
    settings.dispatcher.transfer_expiry = std::chrono::milliseconds(config.transfer_expiry_ms);
    settings.dispatcher.debug_input = config.debug_input;

    settings.debug_connection = config.debug_connection;
    settings.debug_transfer = config.debug_transfer;
    return settings;
}

control::AdapterOptions make_adapter_options(const HostConfig& config) {
    control::AdapterOptions options;
    options.agent_socket = config.agent_socket;
    options.connect_timeout_ms = config.agent_connect_timeout_ms;
    options.screen_width = config.width;
    options.screen_height = config.height;
    options.debug = config.debug_input;
    return options;
}

} // namespace config
