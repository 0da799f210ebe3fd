/*
 * Signaling Records
 *
 * One record per signaling message:
 *   {"type": "offer"|"answer"|"ice"|"participant"|"session_status"|"join",
 *    "payload": {...}, "senderId": "...", "recipientId": "..."}
 *
 * An empty recipientId addresses the whole session.
 */

#ifndef SIGNAL_RECORD_H
#define SIGNAL_RECORD_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace signaling {

struct SignalRecord {
    std::string type;
    nlohmann::json payload = nlohmann::json::object();
    std::string sender_id;
    std::string recipient_id;
};

std::string encode_signal_record(const SignalRecord& record);

// nullopt (and *error set, when given) for a frame that is not a record
std::optional<SignalRecord> decode_signal_record(const std::string& text, std::string* error = nullptr);

// True when the record is for self_id (addressed to it, or broadcast)
bool is_addressed_to(const SignalRecord& record, const std::string& self_id);

} // namespace signaling

#endif // SIGNAL_RECORD_H
