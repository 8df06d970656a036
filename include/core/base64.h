#ifndef VOICE_INJECT_BASE64_H
#define VOICE_INJECT_BASE64_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voice_inject {
namespace Base64 {

// RFC 4648 standard alphabet, '=' padding required.
// Decodes into `out`; returns false (and leaves `out` empty) on invalid input.
bool decode(const std::string& encoded, std::vector<uint8_t>& out);

bool isValid(const std::string& encoded);

// Upper bound of decoded bytes for a well-formed string, 0 if malformed.
size_t decodedSize(const std::string& encoded);

}  // namespace Base64
}  // namespace voice_inject

#endif  // VOICE_INJECT_BASE64_H
