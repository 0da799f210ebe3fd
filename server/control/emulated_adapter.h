/*
 * Emulated Control Adapter
 *
 * In-process fallback used when no native agent is reachable. Nothing is
 * injected into the OS; the adapter tracks a virtual cursor, pressed
 * buttons and keys, and the last clipboard text so the host can show
 * what the controller is doing.
 */

#ifndef EMULATED_ADAPTER_H
#define EMULATED_ADAPTER_H

#include "control_adapter.h"
#include <cstdint>
#include <set>
#include <string>

namespace control {

class EmulatedAdapter : public ControlAdapter {
public:
    EmulatedAdapter(int screen_width, int screen_height, bool debug = false);

    const char* name() const override { return "Emulated (Limited)"; }
    bool init() override;
    void destroy() override;
    bool is_connected() const override { return connected_; }

    void on_pointer_move(double x, double y) override;
    void on_pointer_down(double x, double y, int button) override;
    void on_pointer_up(double x, double y, int button) override;
    void on_scroll(double dx, double dy) override;
    void on_key_down(const std::string& key, const std::string& code,
                     const std::optional<protocol::KeyModifiers>& modifiers) override;
    void on_key_up(const std::string& key, const std::string& code,
                   const std::optional<protocol::KeyModifiers>& modifiers) override;
    void on_clipboard(const std::string& content, ClipboardDone done) override;

    // Virtual cursor in screen pixels
    int cursor_x() const { return cursor_x_; }
    int cursor_y() const { return cursor_y_; }

    // Bit n set while button n is held
    uint32_t button_mask() const { return buttons_; }
    const std::set<std::string>& pressed_keys() const { return keys_; }
    const std::string& clipboard() const { return clipboard_; }
    double scroll_x() const { return scroll_x_; }
    double scroll_y() const { return scroll_y_; }
    uint64_t event_count() const { return events_; }

private:
    void move_to(double x, double y);

    int width_;
    int height_;
    bool debug_;
    bool connected_ = false;

    int cursor_x_ = 0;
    int cursor_y_ = 0;
    uint32_t buttons_ = 0;
    std::set<std::string> keys_;
    std::string clipboard_;
    double scroll_x_ = 0.0;
    double scroll_y_ = 0.0;
    uint64_t events_ = 0;
};

} // namespace control

#endif // EMULATED_ADAPTER_H
