#include "core/base64.h"

#include <array>

namespace voice_inject {
namespace Base64 {

namespace {

constexpr uint8_t kInvalid = 0xFF;

constexpr std::array<uint8_t, 256> buildDecodeTable() {
    std::array<uint8_t, 256> table{};
    for (auto& entry : table) {
        entry = kInvalid;
    }
    for (int i = 0; i < 26; ++i) {
        table[static_cast<std::size_t>('A' + i)] = static_cast<uint8_t>(i);
        table[static_cast<std::size_t>('a' + i)] = static_cast<uint8_t>(26 + i);
    }
    for (int i = 0; i < 10; ++i) {
        table[static_cast<std::size_t>('0' + i)] = static_cast<uint8_t>(52 + i);
    }
    table[static_cast<std::size_t>('+')] = 62;
    table[static_cast<std::size_t>('/')] = 63;
    return table;
}

constexpr std::array<uint8_t, 256> kDecodeTable = buildDecodeTable();

inline uint8_t lookup(char c) {
    return kDecodeTable[static_cast<uint8_t>(c)];
}

size_t paddingCount(const std::string& encoded) {
    const size_t len = encoded.size();
    size_t padding = 0;
    if (len >= 1 && encoded[len - 1] == '=') {
        ++padding;
        if (len >= 2 && encoded[len - 2] == '=') {
            ++padding;
        }
    }
    return padding;
}

}  // namespace

size_t decodedSize(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return 0;
    }
    return (encoded.size() / 4) * 3 - paddingCount(encoded);
}

bool isValid(const std::string& encoded) {
    if (encoded.empty()) {
        return true;
    }
    if (encoded.size() % 4 != 0) {
        return false;
    }
    const size_t dataChars = encoded.size() - paddingCount(encoded);
    for (size_t i = 0; i < dataChars; ++i) {
        if (lookup(encoded[i]) == kInvalid) {
            return false;
        }
    }
    return true;
}

bool decode(const std::string& encoded, std::vector<uint8_t>& out) {
    out.clear();
    if (!isValid(encoded)) {
        return false;
    }
    out.reserve(decodedSize(encoded));

    const size_t padding = paddingCount(encoded);
    const size_t groups = encoded.size() / 4;
    for (size_t g = 0; g < groups; ++g) {
        const size_t i = g * 4;
        const bool last = (g + 1 == groups);
        const size_t pad = last ? padding : 0;

        uint32_t triple = (static_cast<uint32_t>(lookup(encoded[i])) << 18) |
                          (static_cast<uint32_t>(lookup(encoded[i + 1])) << 12);
        if (pad < 2) {
            triple |= static_cast<uint32_t>(lookup(encoded[i + 2])) << 6;
        }
        if (pad < 1) {
            triple |= static_cast<uint32_t>(lookup(encoded[i + 3]));
        }

        out.push_back(static_cast<uint8_t>((triple >> 16) & 0xFF));
        if (pad < 2) {
            out.push_back(static_cast<uint8_t>((triple >> 8) & 0xFF));
        }
        if (pad < 1) {
            out.push_back(static_cast<uint8_t>(triple & 0xFF));
        }
    }
    return true;
}

}  // namespace Base64
}  // namespace voice_inject
