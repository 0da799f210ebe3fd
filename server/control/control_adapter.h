/*
 * Control Adapter
 *
 * Host-side sink for remote input. The peer connection manager hands every
 * accepted pointer/keyboard/scroll/clipboard event to exactly one adapter;
 * how the adapter turns that into input on the host is its own business.
 *
 * Coordinates are normalized to [0, 1] across the shared screen.
 */

#ifndef CONTROL_ADAPTER_H
#define CONTROL_ADAPTER_H

#include "../protocol/control_message.h"
#include <functional>
#include <optional>
#include <string>

namespace control {

class ControlAdapter {
public:
    // Called once the clipboard content was handed off (true) or dropped (false)
    using ClipboardDone = std::function<void(bool ok)>;

    virtual ~ControlAdapter() = default;

    virtual const char* name() const = 0;

    // Connect/prepare. Returns false when the adapter cannot be used.
    virtual bool init() = 0;
    virtual void destroy() = 0;
    virtual bool is_connected() const = 0;

    virtual void on_pointer_move(double x, double y) = 0;
    virtual void on_pointer_down(double x, double y, int button) = 0;
    virtual void on_pointer_up(double x, double y, int button) = 0;
    virtual void on_scroll(double dx, double dy) = 0;
    virtual void on_key_down(const std::string& key, const std::string& code,
                             const std::optional<protocol::KeyModifiers>& modifiers) = 0;
    virtual void on_key_up(const std::string& key, const std::string& code,
                           const std::optional<protocol::KeyModifiers>& modifiers) = 0;
    virtual void on_clipboard(const std::string& content, ClipboardDone done) = 0;
};

} // namespace control

#endif // CONTROL_ADAPTER_H
