/*
 * Control Channel Messages
 *
 * Vocabulary carried over a link's "control" data channel. Every frame is
 * one JSON object with a "type" discriminator:
 *
 *   mousemove      {x, y}                  normalized 0..1
 *   mousedown/up   {x, y, button}
 *   scroll         {deltaX, deltaY}
 *   keydown/up     {key, code, ctrlKey?, altKey?, shiftKey?, metaKey?}
 *   clipboard      {content}
 *   file-meta      {id, name, size, mime, fromUserId}
 *   file-chunk     {id, index, dataB64}
 *   file-complete  {id, totalChunks}
 *   capability     {role, features[]}
 */

#ifndef CONTROL_MESSAGE_H
#define CONTROL_MESSAGE_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace protocol {

enum class Phase {
    Down,
    Up
};

struct PointerMove {
    double x = 0.0;
    double y = 0.0;
};

struct PointerButton {
    double x = 0.0;
    double y = 0.0;
    int button = 0;         // 0 = left, 1 = middle, 2 = right
    Phase phase = Phase::Down;
};

struct Scroll {
    double dx = 0.0;
    double dy = 0.0;
};

struct KeyModifiers {
    bool ctrl = false;
    bool alt = false;
    bool shift = false;
    bool meta = false;
};

struct Key {
    std::string key;        // logical key ("a", "Enter")
    std::string code;       // physical key ("KeyA", "Enter")
    Phase phase = Phase::Down;
    std::optional<KeyModifiers> modifiers;
};

struct Clipboard {
    std::string content;
};

struct FileMeta {
    std::string id;
    std::string name;
    uint64_t size = 0;
    std::string mime;
    std::string from_id;
};

struct FileChunk {
    std::string id;
    uint32_t index = 0;
    std::string data_b64;
};

struct FileComplete {
    std::string id;
    uint32_t total_chunks = 0;
};

struct Capability {
    std::string role;
    std::vector<std::string> features;
};

using ControlMessage = std::variant<PointerMove, PointerButton, Scroll, Key, Clipboard,
                                    FileMeta, FileChunk, FileComplete, Capability>;

// Serialize to a single text frame
std::string encode_control_message(const ControlMessage& message);

/**
 * Parse a text frame
 * @param error Optional; receives the reason when parsing fails
 * @return The message, or nullopt for malformed frames and unknown types
 */
std::optional<ControlMessage> decode_control_message(const std::string& frame,
                                                     std::string* error = nullptr);

// Wire "type" value of a message
const char* message_type_name(const ControlMessage& message);

// Pointer, scroll and keyboard messages
bool is_input_message(const ControlMessage& message);

} // namespace protocol

#endif // CONTROL_MESSAGE_H
