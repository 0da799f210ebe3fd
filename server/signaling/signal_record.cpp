/*
 * Signaling Records Implementation
 */

#include "signal_record.h"
#include "../utils/json_utils.h"

namespace signaling {

std::string encode_signal_record(const SignalRecord& record) {
    json_utils::json j = {
        {"type", record.type},
        {"payload", record.payload},
        {"senderId", record.sender_id}
    };
    if (!record.recipient_id.empty()) {
        j["recipientId"] = record.recipient_id;
    }
    return json_utils::to_string(j);
}

std::optional<SignalRecord> decode_signal_record(const std::string& text, std::string* error) {
    try {
        json_utils::json j = json_utils::parse(text);
        if (!j.is_object()) {
            if (error) *error = "record is not an object";
            return std::nullopt;
        }

        SignalRecord record;
        record.type = json_utils::get_string(j, "type");
        if (record.type.empty()) {
            if (error) *error = "missing type";
            return std::nullopt;
        }
        if (j.contains("payload") && j["payload"].is_object()) {
            record.payload = j["payload"];
        }
        record.sender_id = json_utils::get_string(j, "senderId");
        record.recipient_id = json_utils::get_string(j, "recipientId");
        return record;
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return std::nullopt;
    }
}

bool is_addressed_to(const SignalRecord& record, const std::string& self_id) {
    return record.recipient_id.empty() || record.recipient_id == self_id;
}

} // namespace signaling
