/*
 * Control Channel Dispatcher Implementation
 */

#include "control_dispatcher.h"
#include <algorithm>
#include <cstdio>
#include <exception>

namespace protocol {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

static const char* button_name(int button) {
    switch (button) {
        case 0: return "Left";
        case 1: return "Middle";
        case 2: return "Right";
        default: return "Other";
    }
}

const char* role_name(Role role) {
    return role == Role::Host ? "host" : "controller";
}

std::optional<Role> parse_role(const std::string& name) {
    if (name == "host") return Role::Host;
    if (name == "controller") return Role::Controller;
    return std::nullopt;
}

ControlDispatcher::ControlDispatcher(Role role, event::Loop& loop, DispatcherSettings settings,
                                     notice::NoticeCallback notify)
    : role_(role)
    , loop_(loop)
    , settings_(settings)
    , notify_(std::move(notify))
    , receiver_(settings.max_file_size, settings.max_pending_bytes)
{
}

ControlDispatcher::~ControlDispatcher() {
    stop();
}

void ControlDispatcher::start() {
    if (sweep_timer_ != 0) {
        return;
    }
    // Sweep a few times per expiry period so a stalled transfer is never kept much longer
    auto interval = std::max(std::chrono::milliseconds(1000), settings_.transfer_expiry / 4);
    sweep_timer_ = loop_.schedule_every(interval, [this]() { sweep_transfers(); });
}

void ControlDispatcher::stop() {
    if (sweep_timer_ != 0) {
        loop_.cancel(sweep_timer_);
        sweep_timer_ = 0;
    }
}

void ControlDispatcher::notify(notice::Level level, const std::string& title, const std::string& text) {
    if (notify_) {
        notify_(level, title, text);
    }
}

ControlDispatcher::Outcome ControlDispatcher::dispatch(const std::string& from, const std::string& frame) {
    std::string error;
    auto message = decode_control_message(frame, &error);
    if (!message) {
        fprintf(stderr, "[Control] Dropping malformed frame from %s: %s\n", from.c_str(), error.c_str());
        return Outcome::Malformed;
    }
    return dispatch(from, *message);
}

ControlDispatcher::Outcome ControlDispatcher::dispatch(const std::string& from, const ControlMessage& message) {
    if (settings_.debug_input) {
        fprintf(stderr, "[Control] %s from %s\n", message_type_name(message), from.c_str());
    }

    if (is_input_message(message)) {
        return handle_input(from, message);
    }

    try {
        return std::visit(overloaded{
            [&](const Clipboard& m) {
                return handle_clipboard(from, m);
            },
            [&](const FileMeta& m) {
                auto result = receiver_.on_meta(m, from, loop_.now());
                if (result == FileTransferReceiver::Result::Foreign) {
                    return Outcome::Ignored;
                }
                if (result != FileTransferReceiver::Result::Started) {
                    notify(notice::Level::Warning, "File refused",
                           "Incoming \"" + m.name + "\" could not be accepted.");
                    return Outcome::Ignored;
                }
                notify(notice::Level::Info, "Incoming file",
                       "Receiving \"" + m.name + "\" (" + std::to_string(m.size / 1024) + " KB)");
                return Outcome::Handled;
            },
            [&](const FileChunk& m) {
                auto result = receiver_.on_chunk(m, from, loop_.now());
                if (result == FileTransferReceiver::Result::Rejected) {
                    notify(notice::Level::Warning, "Transfer failed", "A file chunk could not be decoded.");
                }
                return result == FileTransferReceiver::Result::Accepted ? Outcome::Handled : Outcome::Ignored;
            },
            [&](const FileComplete& m) {
                ReceivedFile file;
                auto result = receiver_.on_complete(m, from, file);
                if (result == FileTransferReceiver::Result::Completed) {
                    if (file_sink_) {
                        file_sink_(file);
                    }
                    notify(notice::Level::Info, "File received", "Received \"" + file.name + "\"");
                    return Outcome::Handled;
                }
                if (result == FileTransferReceiver::Result::Rejected) {
                    notify(notice::Level::Warning, "Transfer incomplete",
                           "A file arrived with missing data and was discarded.");
                }
                return Outcome::Ignored;
            },
            [&](const Capability& m) {
                std::string features;
                for (const auto& f : m.features) {
                    if (!features.empty()) features += ",";
                    features += f;
                }
                fprintf(stderr, "[Control] Peer %s is %s (features: %s)\n",
                        from.c_str(), m.role.c_str(), features.c_str());
                return Outcome::Handled;
            },
            [&](const auto&) {
                return Outcome::Ignored;
            },
        }, message);
    } catch (const std::exception& e) {
        fprintf(stderr, "[Control] Error handling %s from %s: %s\n",
                message_type_name(message), from.c_str(), e.what());
        return Outcome::Ignored;
    }
}

ControlDispatcher::Outcome ControlDispatcher::handle_input(const std::string& from, const ControlMessage& message) {
    if (role_ != Role::Host) {
        if (settings_.debug_input) {
            fprintf(stderr, "[Control] Not host, ignoring %s\n", message_type_name(message));
        }
        return Outcome::Ignored;
    }
    if (!settings_.control_enabled) {
        if (settings_.debug_input) {
            fprintf(stderr, "[Control] Control disabled, ignoring %s\n", message_type_name(message));
        }
        return Outcome::Ignored;
    }
    if (!adapter_) {
        fprintf(stderr, "[Control] No control adapter for %s from %s\n", message_type_name(message), from.c_str());
        return Outcome::Ignored;
    }

    control::ControlAdapter& adapter = *adapter_;
    bool debug = settings_.debug_input;

    std::visit(overloaded{
        [&](const PointerMove& m) {
            adapter.on_pointer_move(m.x, m.y);
        },
        [&](const PointerButton& m) {
            if (debug) {
                fprintf(stderr, "[Control] Mouse %s: %s at %.3f, %.3f\n",
                        m.phase == Phase::Down ? "down" : "up", button_name(m.button), m.x, m.y);
            }
            if (m.phase == Phase::Down) {
                adapter.on_pointer_down(m.x, m.y, m.button);
            } else {
                adapter.on_pointer_up(m.x, m.y, m.button);
            }
        },
        [&](const Scroll& m) {
            adapter.on_scroll(m.dx, m.dy);
        },
        [&](const Key& m) {
            if (m.phase == Phase::Down) {
                adapter.on_key_down(m.key, m.code, m.modifiers);
            } else {
                adapter.on_key_up(m.key, m.code, m.modifiers);
            }
        },
        [&](const auto&) {},
    }, message);

    return Outcome::Handled;
}

ControlDispatcher::Outcome ControlDispatcher::handle_clipboard(const std::string& from, const Clipboard& message) {
    if (!settings_.allow_clipboard) {
        fprintf(stderr, "[Control] Clipboard from %s ignored: sharing disabled\n", from.c_str());
        notify(notice::Level::Warning, "Clipboard disabled",
               "Clipboard sync is not enabled for this session.");
        return Outcome::Ignored;
    }

    fprintf(stderr, "[Control] Clipboard from %s (%zu chars)\n", from.c_str(), message.content.size());

    if (role_ == Role::Host && adapter_) {
        adapter_->on_clipboard(message.content, [this](bool ok) {
            if (ok) {
                notify(notice::Level::Info, "Clipboard synced", "Clipboard content received from controller.");
            } else {
                notify(notice::Level::Warning, "Clipboard sync failed", "Unable to write to the host clipboard.");
            }
        });
        return Outcome::Handled;
    }

    if (clipboard_sink_) {
        clipboard_sink_(from, message.content);
        notify(notice::Level::Info, "Clipboard synced",
               std::string("Clipboard content received from ") + (role_ == Role::Host ? "controller." : "host."));
        return Outcome::Handled;
    }
    return Outcome::Ignored;
}

void ControlDispatcher::sweep_transfers() {
    auto expired = receiver_.expire_stale(loop_.now(), settings_.transfer_expiry);
    if (!expired.empty()) {
        notify(notice::Level::Warning, "Transfer incomplete",
               std::to_string(expired.size()) + " stalled file transfer(s) were discarded.");
    }
}

size_t ControlDispatcher::drop_transfers_from(const std::string& from) {
    return receiver_.drop_from(from);
}

} // namespace protocol
