/*
 * Base64 helpers for file chunks carried in control-channel JSON frames
 */

#ifndef BASE64_H
#define BASE64_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace base64 {

std::string encode(const uint8_t* data, size_t len);
std::string encode(const std::vector<uint8_t>& data);

/**
 * Decode standard (RFC 4648) base64. Whitespace is skipped, decoding stops at
 * the first '='. Returns false on any character outside the alphabet.
 */
bool decode(const std::string& in, std::vector<uint8_t>& out);

} // namespace base64

#endif // BASE64_H
