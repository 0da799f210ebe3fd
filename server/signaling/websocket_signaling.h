/*
 * WebSocket Signaling Client
 *
 * Connects to the session relay with libdatachannel's rtc::WebSocket and
 * exchanges one JSON SignalRecord per text message. A "join" record with
 * our id, role and session id is sent as soon as the socket opens.
 */

#ifndef WEBSOCKET_SIGNALING_H
#define WEBSOCKET_SIGNALING_H

#include "signaling_channel.h"
#include <rtc/rtc.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace signaling {

class WebSocketSignaling : public SignalingChannel {
public:
    WebSocketSignaling(std::string self_id, std::string role, std::string session_id, bool debug);
    ~WebSocketSignaling() override;

    // Start connecting; false when the URL is rejected
    bool connect(const std::string& url);
    void disconnect();

    bool publish(const SignalRecord& record) override;
    bool is_connected() const override;
    void on_record(RecordCallback callback) override;

private:
    void handle_message(const std::string& text);
    SignalRecord join_record() const;

    std::string self_id_;
    std::string role_;
    std::string session_id_;
    bool debug_;

    std::shared_ptr<rtc::WebSocket> ws_;
    std::mutex callback_mutex_;
    RecordCallback callback_;
    std::atomic<bool> open_{false};
};

} // namespace signaling

#endif // WEBSOCKET_SIGNALING_H
