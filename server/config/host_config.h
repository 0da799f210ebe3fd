/*
 * Host Configuration
 *
 * Every tunable of desklink-host in one value, passed explicitly into the
 * components that need it. Populated in order:
 *   defaults -> JSON config file (--config) -> DESKLINK_* environment -> command line
 */

#ifndef HOST_CONFIG_H
#define HOST_CONFIG_H

#include "../control/adapter_selector.h"
#include "../webrtc/peer_connection_manager.h"
#include <string>
#include <vector>

namespace config {

struct HostConfig {
    // Identity
    std::string self_id;             // generated when empty
    std::string role = "host";       // "host" or "controller"
    std::string session_id = "default";

    // Network
    std::string signaling_url = "ws://127.0.0.1:8090/signal";
    std::vector<std::string> ice_servers = {
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302"
    };

    // Remote control
    std::string agent_socket = "/tmp/desklink-agent.sock";
    int agent_connect_timeout_ms = 1500;
    bool allow_clipboard = true;
    bool control_enabled = true;

    // Quality adaptation
    std::string initial_preset = "high";
    bool auto_adjust = true;
    int adjust_cooldown_ms = 5000;
    int sample_interval_ms = 1000;
    int quality_history_size = 10;

    // File transfer
    int transfer_expiry_ms = 60000;
    int max_file_size_mb = 100;
    int max_pending_transfer_mb = 256;     // all incoming files in progress together
    std::string download_dir = ".";

    // Capture (synthetic source)
    bool test_pattern = true;
    bool capture_autostart = false;
    int width = 1280;
    int height = 720;
    int fps = 30;

    // Debug flags
    bool debug_connection = false;   // signaling, ICE, state changes
    bool debug_quality = false;      // per-tick stats
    bool debug_input = false;        // every control message
    bool debug_transfer = false;     // per-chunk progress

    /**
     * Load a JSON config file. Keys match the field names above.
     * @return false if the file cannot be read or parsed
     */
    bool load_from_file(const std::string& path);

    /**
     * Load configuration from environment variables
     * Checks DESKLINK_DEBUG_* and a few DESKLINK_* settings
     */
    void load_from_env();

    /**
     * Parse command-line arguments. Exits on --help or a bad option.
     */
    void parse_command_line(int argc, char* argv[]);

    // Check values and fill in derived defaults (self_id). Logs each problem.
    bool validate();

    void print_summary() const;
    void print_usage(const char* program_name) const;
};

// Value of --config in argv, empty when absent
std::string find_config_path(int argc, char* argv[]);

webrtc::ManagerSettings make_manager_settings(const HostConfig& config);
control::AdapterOptions make_adapter_options(const HostConfig& config);

} // namespace config

#endif // HOST_CONFIG_H
