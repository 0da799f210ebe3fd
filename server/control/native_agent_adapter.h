/*
 * Native Agent Adapter
 *
 * Forwards input to an out-of-process helper that performs real OS-level
 * injection. The helper listens on a UNIX stream socket; each event is one
 * line of JSON using the control-channel wire names, preceded by a
 * {"type":"hello"} line on connect.
 *
 * Sends never block the caller. Once the helper goes away the adapter
 * reports disconnected and further events are dropped.
 */

#ifndef NATIVE_AGENT_ADAPTER_H
#define NATIVE_AGENT_ADAPTER_H

#include "control_adapter.h"
#include <cstdint>
#include <string>

namespace control {

class NativeAgentAdapter : public ControlAdapter {
public:
    NativeAgentAdapter(const std::string& socket_path, int connect_timeout_ms, bool debug = false);
    ~NativeAgentAdapter() override;

    const char* name() const override { return "Native Agent"; }
    bool init() override;
    void destroy() override;
    bool is_connected() const override { return socket_ >= 0; }

    void on_pointer_move(double x, double y) override;
    void on_pointer_down(double x, double y, int button) override;
    void on_pointer_up(double x, double y, int button) override;
    void on_scroll(double dx, double dy) override;
    void on_key_down(const std::string& key, const std::string& code,
                     const std::optional<protocol::KeyModifiers>& modifiers) override;
    void on_key_up(const std::string& key, const std::string& code,
                   const std::optional<protocol::KeyModifiers>& modifiers) override;
    void on_clipboard(const std::string& content, ClipboardDone done) override;

    const std::string& socket_path() const { return socket_path_; }
    uint64_t dropped_count() const { return dropped_; }

private:
    bool connect_socket();
    bool send_line(const std::string& text);
    void send_event(const protocol::ControlMessage& message);

    std::string socket_path_;
    int connect_timeout_ms_;
    bool debug_;
    int socket_ = -1;
    uint64_t dropped_ = 0;
};

} // namespace control

#endif // NATIVE_AGENT_ADAPTER_H
