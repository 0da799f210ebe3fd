/*
 * WebSocket Signaling Client Implementation
 */

#include "websocket_signaling.h"
#include <cstdio>

namespace signaling {

WebSocketSignaling::WebSocketSignaling(std::string self_id, std::string role,
                                       std::string session_id, bool debug)
    : self_id_(std::move(self_id))
    , role_(std::move(role))
    , session_id_(std::move(session_id))
    , debug_(debug)
{}

WebSocketSignaling::~WebSocketSignaling() {
    disconnect();
}

SignalRecord WebSocketSignaling::join_record() const {
    SignalRecord record;
    record.type = "join";
    record.sender_id = self_id_;
    record.payload = {
        {"role", role_},
        {"sessionId", session_id_}
    };
    return record;
}

bool WebSocketSignaling::connect(const std::string& url) {
    disconnect();

    try {
        ws_ = std::make_shared<rtc::WebSocket>();

        ws_->onOpen([this, url]() {
            open_ = true;
            fprintf(stderr, "[Signaling] Connected to %s\n", url.c_str());
            if (!publish(join_record())) {
                fprintf(stderr, "[Signaling] Failed to send join record\n");
            }
        });

        ws_->onClosed([this]() {
            if (open_.exchange(false)) {
                fprintf(stderr, "[Signaling] Connection closed\n");
            }
        });

        ws_->onError([](std::string error) {
            fprintf(stderr, "[Signaling] WebSocket error: %s\n", error.c_str());
        });

        ws_->onMessage([this](rtc::message_variant data) {
            if (std::holds_alternative<std::string>(data)) {
                handle_message(std::get<std::string>(data));
            }
        });

        ws_->open(url);
    } catch (const std::exception& e) {
        fprintf(stderr, "[Signaling] Failed to open %s: %s\n", url.c_str(), e.what());
        ws_.reset();
        return false;
    }

    if (debug_) {
        fprintf(stderr, "[Signaling] Connecting to %s as %s (%s)\n",
                url.c_str(), self_id_.c_str(), role_.c_str());
    }
    return true;
}

void WebSocketSignaling::disconnect() {
    if (!ws_) return;
    try {
        ws_->resetCallbacks();
        ws_->close();
    } catch (const std::exception& e) {
        fprintf(stderr, "[Signaling] Close failed: %s\n", e.what());
    }
    ws_.reset();
    open_ = false;
}

bool WebSocketSignaling::publish(const SignalRecord& record) {
    auto ws = ws_;
    if (!ws || !open_) {
        fprintf(stderr, "[Signaling] Not connected, dropping %s record\n", record.type.c_str());
        return false;
    }

    try {
        // A false return means buffered, not lost
        if (!ws->send(encode_signal_record(record)) && debug_) {
            fprintf(stderr, "[Signaling] %s record buffered\n", record.type.c_str());
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "[Signaling] Send of %s record failed: %s\n", record.type.c_str(), e.what());
        return false;
    }

    if (debug_) {
        fprintf(stderr, "[Signaling] Sent %s to %s\n", record.type.c_str(),
                record.recipient_id.empty() ? "session" : record.recipient_id.c_str());
    }
    return true;
}

bool WebSocketSignaling::is_connected() const {
    return open_;
}

void WebSocketSignaling::on_record(RecordCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void WebSocketSignaling::handle_message(const std::string& text) {
    std::string error;
    auto record = decode_signal_record(text, &error);
    if (!record) {
        fprintf(stderr, "[Signaling] Dropping malformed record: %s\n", error.c_str());
        return;
    }

    RecordCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = callback_;
    }
    if (callback) {
        callback(*record);
    }
}

} // namespace signaling
