/*
 * Control Channel Messages Implementation
 */

#include "control_message.h"
#include "../utils/json_utils.h"
#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>

namespace protocol {

using json_utils::json;

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

static double clamp_unit(double v) {
    return std::max(0.0, std::min(1.0, v));
}

// Coordinates must be finite numbers; out-of-range values are clamped
static bool read_coordinate(const json& j, const char* key, double& out, std::string& error) {
    if (!json_utils::has_number(j, key)) {
        error = std::string("missing or non-numeric '") + key + "'";
        return false;
    }
    double v = json_utils::get_double(j, key);
    if (!std::isfinite(v)) {
        error = std::string("non-finite '") + key + "'";
        return false;
    }
    out = clamp_unit(v);
    return true;
}

static bool read_string(const json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key) || !j[key].is_string()) {
        error = std::string("missing or non-string '") + key + "'";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

static bool read_count(const json& j, const char* key, uint64_t max, uint64_t& out, std::string& error) {
    if (!j.contains(key) || !j[key].is_number_integer() ||
        (!j[key].is_number_unsigned() && j[key].get<int64_t>() < 0)) {
        error = std::string("missing or invalid '") + key + "'";
        return false;
    }
    uint64_t v = j[key].get<uint64_t>();
    if (v > max) {
        error = std::string("out of range '") + key + "'";
        return false;
    }
    out = v;
    return true;
}

std::string encode_control_message(const ControlMessage& message) {
    json j = std::visit(overloaded{
        [](const PointerMove& m) {
            return json{{"type", "mousemove"}, {"x", m.x}, {"y", m.y}};
        },
        [](const PointerButton& m) {
            return json{{"type", m.phase == Phase::Down ? "mousedown" : "mouseup"},
                        {"x", m.x}, {"y", m.y}, {"button", m.button}};
        },
        [](const Scroll& m) {
            return json{{"type", "scroll"}, {"deltaX", m.dx}, {"deltaY", m.dy}};
        },
        [](const Key& m) {
            json k = {{"type", m.phase == Phase::Down ? "keydown" : "keyup"},
                      {"key", m.key}, {"code", m.code}};
            if (m.modifiers) {
                k["ctrlKey"] = m.modifiers->ctrl;
                k["altKey"] = m.modifiers->alt;
                k["shiftKey"] = m.modifiers->shift;
                k["metaKey"] = m.modifiers->meta;
            }
            return k;
        },
        [](const Clipboard& m) {
            return json{{"type", "clipboard"}, {"content", m.content}};
        },
        [](const FileMeta& m) {
            return json{{"type", "file-meta"}, {"id", m.id}, {"name", m.name},
                        {"size", m.size}, {"mime", m.mime}, {"fromUserId", m.from_id}};
        },
        [](const FileChunk& m) {
            return json{{"type", "file-chunk"}, {"id", m.id}, {"index", m.index},
                        {"dataB64", m.data_b64}};
        },
        [](const FileComplete& m) {
            return json{{"type", "file-complete"}, {"id", m.id}, {"totalChunks", m.total_chunks}};
        },
        [](const Capability& m) {
            return json{{"type", "capability"}, {"role", m.role}, {"features", m.features}};
        },
    }, message);

    return json_utils::to_string(j);
}

std::optional<ControlMessage> decode_control_message(const std::string& frame, std::string* error) {
    std::string reason;
    std::optional<ControlMessage> result;

    try {
        json j = json_utils::parse(frame);
        if (!j.is_object()) {
            reason = "frame is not an object";
        } else {
            std::string type = json_utils::get_string(j, "type");

            if (type == "mousemove") {
                PointerMove m;
                if (read_coordinate(j, "x", m.x, reason) && read_coordinate(j, "y", m.y, reason)) {
                    result = m;
                }
            } else if (type == "mousedown" || type == "mouseup") {
                PointerButton m;
                m.phase = type == "mousedown" ? Phase::Down : Phase::Up;
                if (read_coordinate(j, "x", m.x, reason) && read_coordinate(j, "y", m.y, reason)) {
                    m.button = json_utils::get_int(j, "button", 0);
                    if (m.button < 0 || m.button > 4) {
                        reason = "invalid 'button'";
                    } else {
                        result = m;
                    }
                }
            } else if (type == "scroll") {
                Scroll m;
                m.dx = json_utils::get_double(j, "deltaX");
                m.dy = json_utils::get_double(j, "deltaY");
                if (!std::isfinite(m.dx) || !std::isfinite(m.dy)) {
                    reason = "non-finite scroll delta";
                } else {
                    result = m;
                }
            } else if (type == "keydown" || type == "keyup") {
                Key m;
                m.phase = type == "keydown" ? Phase::Down : Phase::Up;
                if (read_string(j, "key", m.key, reason)) {
                    m.code = json_utils::get_string(j, "code");
                    if (json_utils::has_key(j, "ctrlKey") || json_utils::has_key(j, "altKey") ||
                        json_utils::has_key(j, "shiftKey") || json_utils::has_key(j, "metaKey")) {
                        KeyModifiers mods;
                        mods.ctrl = json_utils::get_bool(j, "ctrlKey");
                        mods.alt = json_utils::get_bool(j, "altKey");
                        mods.shift = json_utils::get_bool(j, "shiftKey");
                        mods.meta = json_utils::get_bool(j, "metaKey");
                        m.modifiers = mods;
                    }
                    result = m;
                }
            } else if (type == "clipboard") {
                Clipboard m;
                if (read_string(j, "content", m.content, reason)) {
                    result = m;
                }
            } else if (type == "file-meta") {
                FileMeta m;
                if (read_string(j, "id", m.id, reason) && read_string(j, "name", m.name, reason) &&
                    read_count(j, "size", std::numeric_limits<uint64_t>::max(), m.size, reason)) {
                    m.mime = json_utils::get_string(j, "mime", "application/octet-stream");
                    m.from_id = json_utils::get_string(j, "fromUserId");
                    result = m;
                }
            } else if (type == "file-chunk") {
                FileChunk m;
                uint64_t index = 0;
                if (read_string(j, "id", m.id, reason) &&
                    read_count(j, "index", std::numeric_limits<uint32_t>::max(), index, reason) &&
                    read_string(j, "dataB64", m.data_b64, reason)) {
                    m.index = static_cast<uint32_t>(index);
                    result = m;
                }
            } else if (type == "file-complete") {
                FileComplete m;
                uint64_t total = 0;
                if (read_string(j, "id", m.id, reason) &&
                    read_count(j, "totalChunks", std::numeric_limits<uint32_t>::max(), total, reason)) {
                    m.total_chunks = static_cast<uint32_t>(total);
                    result = m;
                }
            } else if (type == "capability") {
                Capability m;
                m.role = json_utils::get_string(j, "role");
                m.features = json_utils::get_string_array(j, "features");
                result = m;
            } else if (type.empty()) {
                reason = "missing 'type'";
            } else {
                reason = "unknown type '" + type + "'";
            }
        }
    } catch (const std::exception& e) {
        reason = e.what();
        result.reset();
    }

    if (!result && error) {
        *error = reason;
    }
    return result;
}

const char* message_type_name(const ControlMessage& message) {
    return std::visit(overloaded{
        [](const PointerMove&) { return "mousemove"; },
        [](const PointerButton& m) { return m.phase == Phase::Down ? "mousedown" : "mouseup"; },
        [](const Scroll&) { return "scroll"; },
        [](const Key& m) { return m.phase == Phase::Down ? "keydown" : "keyup"; },
        [](const Clipboard&) { return "clipboard"; },
        [](const FileMeta&) { return "file-meta"; },
        [](const FileChunk&) { return "file-chunk"; },
        [](const FileComplete&) { return "file-complete"; },
        [](const Capability&) { return "capability"; },
    }, message);
}

bool is_input_message(const ControlMessage& message) {
    return std::holds_alternative<PointerMove>(message) ||
           std::holds_alternative<PointerButton>(message) ||
           std::holds_alternative<Scroll>(message) ||
           std::holds_alternative<Key>(message);
}

} // namespace protocol
