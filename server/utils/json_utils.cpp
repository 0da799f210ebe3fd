/*
 * JSON Utilities Implementation
 */

#include "json_utils.h"
#include <fstream>
#include <stdexcept>

namespace json_utils {

namespace {

// Field of an object, or nullptr
const json* field(const json& j, const std::string& key) {
    if (!j.is_object()) return nullptr;
    auto it = j.find(key);
    return it == j.end() ? nullptr : &*it;
}

} // namespace

json parse(const std::string& str) {
    return json::parse(str);
}

json parse_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    return json::parse(in);
}

std::string to_string(const json& j, int indent) {
    // Invalid UTF-8 becomes U+FFFD instead of throwing type_error.316
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string get_string(const json& j, const std::string& key, const std::string& fallback) {
    const json* v = field(j, key);
    return v && v->is_string() ? v->get<std::string>() : fallback;
}

int get_int(const json& j, const std::string& key, int fallback) {
    const json* v = field(j, key);
    return v && v->is_number_integer() ? v->get<int>() : fallback;
}

uint64_t get_uint64(const json& j, const std::string& key, uint64_t fallback) {
    const json* v = field(j, key);
    if (!v) return fallback;
    if (v->is_number_unsigned()) return v->get<uint64_t>();
    if (v->is_number_integer()) {
        int64_t n = v->get<int64_t>();
        return n < 0 ? fallback : static_cast<uint64_t>(n);
    }
    return fallback;
}

double get_double(const json& j, const std::string& key, double fallback) {
    const json* v = field(j, key);
    return v && v->is_number() ? v->get<double>() : fallback;
}

bool get_bool(const json& j, const std::string& key, bool fallback) {
    const json* v = field(j, key);
    return v && v->is_boolean() ? v->get<bool>() : fallback;
}

std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> out;
    const json* v = field(j, key);
    if (!v || !v->is_array()) return out;

    for (const auto& item : *v) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

bool has_key(const json& j, const std::string& key) {
    return field(j, key) != nullptr;
}

bool has_number(const json& j, const std::string& key) {
    const json* v = field(j, key);
    return v && v->is_number();
}

} // namespace json_utils
