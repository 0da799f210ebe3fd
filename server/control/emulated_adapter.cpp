/*
 * Emulated Control Adapter Implementation
 */

#include "emulated_adapter.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace control {

EmulatedAdapter::EmulatedAdapter(int screen_width, int screen_height, bool debug)
    : width_(std::max(1, screen_width))
    , height_(std::max(1, screen_height))
    , debug_(debug)
{
}

bool EmulatedAdapter::init() {
    connected_ = true;
    return true;
}

void EmulatedAdapter::destroy() {
    connected_ = false;
    buttons_ = 0;
    keys_.clear();
}

void EmulatedAdapter::move_to(double x, double y) {
    x = std::max(0.0, std::min(1.0, x));
    y = std::max(0.0, std::min(1.0, y));
    cursor_x_ = static_cast<int>(std::lround(x * (width_ - 1)));
    cursor_y_ = static_cast<int>(std::lround(y * (height_ - 1)));
}

void EmulatedAdapter::on_pointer_move(double x, double y) {
    if (!connected_) return;
    move_to(x, y);
    events_++;
}

void EmulatedAdapter::on_pointer_down(double x, double y, int button) {
    if (!connected_) return;
    move_to(x, y);
    if (button >= 0 && button < 32) {
        buttons_ |= (1u << button);
    }
    events_++;
    if (debug_) {
        fprintf(stderr, "[Control] Emulated button %d down at %d,%d\n", button, cursor_x_, cursor_y_);
    }
}

void EmulatedAdapter::on_pointer_up(double x, double y, int button) {
    if (!connected_) return;
    move_to(x, y);
    if (button >= 0 && button < 32) {
        buttons_ &= ~(1u << button);
    }
    events_++;
    if (debug_) {
        fprintf(stderr, "[Control] Emulated button %d up at %d,%d\n", button, cursor_x_, cursor_y_);
    }
}

void EmulatedAdapter::on_scroll(double dx, double dy) {
    if (!connected_) return;
    scroll_x_ += dx;
    scroll_y_ += dy;
    events_++;
}

void EmulatedAdapter::on_key_down(const std::string& key, const std::string& code,
                                  const std::optional<protocol::KeyModifiers>& modifiers) {
    if (!connected_) return;
    keys_.insert(code.empty() ? key : code);
    events_++;
    if (debug_) {
        fprintf(stderr, "[Control] Emulated key down %s (%s)%s\n", key.c_str(), code.c_str(),
                modifiers && (modifiers->ctrl || modifiers->alt || modifiers->shift || modifiers->meta)
                    ? " +mods" : "");
    }
}

void EmulatedAdapter::on_key_up(const std::string& key, const std::string& code,
                                const std::optional<protocol::KeyModifiers>&) {
    if (!connected_) return;
    keys_.erase(code.empty() ? key : code);
    events_++;
    if (debug_) {
        fprintf(stderr, "[Control] Emulated key up %s (%s)\n", key.c_str(), code.c_str());
    }
}

void EmulatedAdapter::on_clipboard(const std::string& content, ClipboardDone done) {
    clipboard_ = content;
    events_++;
    if (debug_) {
        fprintf(stderr, "[Control] Emulated clipboard set (%zu chars)\n", content.size());
    }
    if (done) {
        done(true);
    }
}

} // namespace control
