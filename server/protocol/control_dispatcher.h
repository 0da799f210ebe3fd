/*
 * Control Channel Dispatcher
 *
 * Turns inbound control-channel frames into actions:
 * - pointer/keyboard/scroll reach the control adapter, on a host with
 *   control enabled only
 * - clipboard is honoured on either side when the session allows it
 * - file-meta/chunk/complete feed the file receiver; finished files go to
 *   the file sink
 * - capability is logged
 *
 * Malformed frames are logged and dropped; the link is not affected.
 * Must be used from the event loop thread.
 */

#ifndef CONTROL_DISPATCHER_H
#define CONTROL_DISPATCHER_H

#include "control_message.h"
#include "file_transfer.h"
#include "../control/control_adapter.h"
#include "../event/event_loop.h"
#include "../utils/notice.h"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace protocol {

enum class Role {
    Host,
    Controller
};

const char* role_name(Role role);
std::optional<Role> parse_role(const std::string& name);

struct DispatcherSettings {
    bool control_enabled = true;
    bool allow_clipboard = true;
    uint64_t max_file_size = 100ull * 1024 * 1024;
    uint64_t max_pending_bytes = 256ull * 1024 * 1024;   // all open incoming transfers
    std::chrono::milliseconds transfer_expiry{60000};
    bool debug_input = false;
};

class ControlDispatcher {
public:
    using FileSink = std::function<void(const ReceivedFile& file)>;
    using ClipboardSink = std::function<void(const std::string& from, const std::string& content)>;

    enum class Outcome {
        Handled,
        Ignored,        // valid, but not acted on (role, permission, no adapter)
        Malformed
    };

    ControlDispatcher(Role role, event::Loop& loop, DispatcherSettings settings,
                      notice::NoticeCallback notify = nullptr);
    ~ControlDispatcher();

    ControlDispatcher(const ControlDispatcher&) = delete;
    ControlDispatcher& operator=(const ControlDispatcher&) = delete;

    // Start/stop the periodic sweep of stalled file transfers
    void start();
    void stop();

    // Not owned; may be null
    void set_adapter(control::ControlAdapter* adapter) { adapter_ = adapter; }
    void set_file_sink(FileSink sink) { file_sink_ = std::move(sink); }

    // Where received clipboard text goes when there is no adapter (controller side)
    void set_clipboard_sink(ClipboardSink sink) { clipboard_sink_ = std::move(sink); }

    void set_control_enabled(bool enabled) { settings_.control_enabled = enabled; }
    void set_allow_clipboard(bool allowed) { settings_.allow_clipboard = allowed; }
    bool control_enabled() const { return settings_.control_enabled; }
    bool allow_clipboard() const { return settings_.allow_clipboard; }
    Role role() const { return role_; }

    Outcome dispatch(const std::string& from, const std::string& frame);
    Outcome dispatch(const std::string& from, const ControlMessage& message);

    // Forget partial transfers from a peer whose link went away
    size_t drop_transfers_from(const std::string& from);

    FileTransferReceiver& receiver() { return receiver_; }

private:
    Outcome handle_input(const std::string& from, const ControlMessage& message);
    Outcome handle_clipboard(const std::string& from, const Clipboard& message);
    void sweep_transfers();
    void notify(notice::Level level, const std::string& title, const std::string& text);

    Role role_;
    event::Loop& loop_;
    DispatcherSettings settings_;
    notice::NoticeCallback notify_;

    control::ControlAdapter* adapter_ = nullptr;
    FileSink file_sink_;
    ClipboardSink clipboard_sink_;
    FileTransferReceiver receiver_;
    event::TimerId sweep_timer_ = 0;
};

} // namespace protocol

#endif // CONTROL_DISPATCHER_H
