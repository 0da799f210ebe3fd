/*
 * JSON Utilities
 *
 * Wrapper around nlohmann/json for the lookups the control channel,
 * signaling client and config loader repeat everywhere.
 */

#ifndef JSON_UTILS_H
#define JSON_UTILS_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace json_utils {

using json = nlohmann::json;

// Throws nlohmann::json::parse_error; callers that accept untrusted
// frames catch it and drop the frame
json parse(const std::string& str);
json parse_file(const std::string& path);

// Compact unless indent >= 0. Never throws: invalid UTF-8 in strings is
// replaced with U+FFFD.
std::string to_string(const json& j, int indent = -1);

// Field lookups. A missing key or a value of the wrong type yields the
// fallback, never an exception.
std::string get_string(const json& j, const std::string& key, const std::string& fallback = "");
int get_int(const json& j, const std::string& key, int fallback = 0);
uint64_t get_uint64(const json& j, const std::string& key, uint64_t fallback = 0);   // negative -> fallback
double get_double(const json& j, const std::string& key, double fallback = 0.0);    // any number
bool get_bool(const json& j, const std::string& key, bool fallback = false);
std::vector<std::string> get_string_array(const json& j, const std::string& key);  // non-strings skipped

bool has_key(const json& j, const std::string& key);
bool has_number(const json& j, const std::string& key);

} // namespace json_utils

#endif // JSON_UTILS_H
