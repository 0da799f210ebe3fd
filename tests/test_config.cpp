/*
 *  test_config.cpp - Configuration layering
 *
 *  defaults -> JSON file -> DESKLINK_* environment -> command line, then
 *  validation and the settings handed to the manager and adapters.
 */

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <initializer_list>
#include <string>
#include <vector>

#include "config/host_config.h"

static int failures = 0;

static void check(bool ok, const char *what)
{
	printf("  %s: %s\n", ok ? "ok  " : "FAIL", what);
	if (!ok) failures++;
}

// getopt wants mutable strings
struct Args {
	std::vector<std::string> storage;
	std::vector<char *> argv;

	Args(std::initializer_list<const char *> list)
	{
		for (const char *a : list) storage.push_back(a);
		for (auto &s : storage) argv.push_back(&s[0]);
		argv.push_back(nullptr);
	}

	int argc() const { return static_cast<int>(storage.size()); }
	char **data() { return argv.data(); }
};

static std::string write_temp(const std::string &text)
{
	std::string path = "/tmp/desklink-test-config-" + std::to_string(getpid()) + ".json";
	FILE *f = fopen(path.c_str(), "w");
	if (!f) return "";
	fputs(text.c_str(), f);
	fclose(f);
	return path;
}

static void test_defaults()
{
	printf("\n=== Defaults ===\n");

	config::HostConfig cfg;
	check(cfg.role == "host" && cfg.initial_preset == "high", "host at the high preset");
	check(cfg.ice_servers.size() == 2, "two public STUN servers");
	check(cfg.adjust_cooldown_ms == 5000 && cfg.sample_interval_ms == 1000, "5 s cooldown, 1 s sampling");
	check(cfg.validate(), "defaults validate");
	check(cfg.self_id.compare(0, 5, "host-") == 0 && cfg.self_id.size() == 11, "participant id generated");
}

static void test_layering()
{
	printf("\n=== File, environment, command line ===\n");

	std::string path = write_temp(
		"{\"role\": \"controller\", \"session_id\": \"from-file\", \"initial_preset\": \"low\","
		" \"ice_servers\": [\"stun:file.example:3478\"], \"max_file_size_mb\": 5,"
		" \"max_pending_transfer_mb\": 20,"
		" \"allow_clipboard\": false, \"debug_quality\": true}");
	check(!path.empty(), "config file written");

	config::HostConfig cfg;
	check(cfg.load_from_file(path), "config file loads");
	check(cfg.role == "controller" && cfg.session_id == "from-file", "file values applied");
	check(cfg.ice_servers.size() == 1 && cfg.ice_servers[0] == "stun:file.example:3478", "file replaces ICE servers");
	check(!cfg.allow_clipboard && cfg.debug_quality, "file booleans applied");
	check(cfg.fps == 30, "keys not in the file keep their defaults");

	setenv("DESKLINK_SESSION_ID", "from-env", 1);
	setenv("DESKLINK_DEBUG_INPUT", "1", 1);
	setenv("DESKLINK_DEBUG_TRANSFER", "0", 1);
	cfg.load_from_env();
	unsetenv("DESKLINK_SESSION_ID");
	unsetenv("DESKLINK_DEBUG_INPUT");
	unsetenv("DESKLINK_DEBUG_TRANSFER");
	check(cfg.session_id == "from-env", "environment overrides the file");
	check(cfg.debug_input && !cfg.debug_transfer, "debug flag \"0\" stays off");

	Args args({"desklink-host", "-S", "from-cli", "--ice-server", "stun:a:1", "--ice-server", "turn:b:2",
	           "--preset", "medium", "--clipboard", "on", "--cooldown", "2000", "-a", "--width", "800"});
	cfg.parse_command_line(args.argc(), args.data());
	check(cfg.session_id == "from-cli", "command line overrides the environment");
	check(cfg.ice_servers.size() == 2 && cfg.ice_servers[0] == "stun:a:1", "repeated --ice-server replaces the list");
	check(cfg.initial_preset == "medium" && cfg.allow_clipboard, "preset and clipboard switched");
	check(cfg.adjust_cooldown_ms == 2000 && cfg.capture_autostart && cfg.width == 800, "numeric and flag options");
	check(cfg.validate(), "layered config validates");

	webrtc::ManagerSettings settings = config::make_manager_settings(cfg);
	check(settings.role == protocol::Role::Controller, "manager role");
	check(settings.bitrate.initial_preset == "medium" && settings.bitrate.cooldown.count() == 2000,
	      "bitrate settings");
	check(settings.dispatcher.max_file_size == 5ull * 1024 * 1024, "file limit in bytes");
	check(settings.dispatcher.max_pending_bytes == 20ull * 1024 * 1024, "pending transfer limit in bytes");
	check(settings.monitor.debug && settings.dispatcher.debug_input, "debug flags carried");

	control::AdapterOptions options = config::make_adapter_options(cfg);
	check(options.screen_width == 800 && options.agent_socket == cfg.agent_socket, "adapter options");

	Args with_config({"desklink-host", "--role", "host", "--config", path.c_str()});
	check(config::find_config_path(with_config.argc(), with_config.data()) == path, "config path found in argv");
	Args without({"desklink-host", "-r", "host"});
	check(config::find_config_path(without.argc(), without.data()).empty(), "no config path");

	unlink(path.c_str());
}

static void test_invalid()
{
	printf("\n=== Validation ===\n");

	config::HostConfig bad_role;
	bad_role.role = "viewer";
	check(!bad_role.validate() && bad_role.self_id.empty(), "unknown role rejected, no id generated");

	config::HostConfig bad_preset;
	bad_preset.initial_preset = "4k";
	check(!bad_preset.validate(), "unknown preset rejected");

	config::HostConfig bad_capture;
	bad_capture.fps = 0;
	check(!bad_capture.validate(), "zero fps rejected");

	config::HostConfig bad_interval;
	bad_interval.sample_interval_ms = 0;
	check(!bad_interval.validate(), "zero sampling interval rejected");

	config::HostConfig bad_pending;
	bad_pending.max_file_size_mb = 50;
	bad_pending.max_pending_transfer_mb = 40;
	check(!bad_pending.validate(), "pending limit below the file limit rejected");

	Args pending({"desklink-host", "--max-pending", "512"});
	config::HostConfig from_cli;
	from_cli.parse_command_line(pending.argc(), pending.data());
	check(from_cli.max_pending_transfer_mb == 512 && from_cli.validate(), "--max-pending read");

	config::HostConfig cfg;
	check(!cfg.load_from_file("/nonexistent/desklink.json"), "missing file reported");
	std::string path = write_temp("{ not json");
	check(!cfg.load_from_file(path), "broken file reported");
	unlink(path.c_str());
	check(cfg.role == "host", "failed load leaves the config alone");

	Args none({"desklink-host", "--no-ice-servers"});
	cfg.parse_command_line(none.argc(), none.data());
	check(cfg.ice_servers.empty(), "--no-ice-servers clears the list");
}

int main()
{
	printf("=== test_config - configuration layering ===\n");

	test_defaults();
	test_layering();
	test_invalid();

	bool passed = failures == 0;
	if (passed) {
		printf("\n*** PASS: configuration ***\n");
	} else {
		printf("\n*** FAIL: %d check(s) failed ***\n", failures);
	}
	return passed ? 0 : 1;
}
