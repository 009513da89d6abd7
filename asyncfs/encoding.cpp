#include "asyncfs/encoding.h"
#include <cstddef>

namespace asyncfs {

static const char replacement[] = "\xEF\xBF\xBD";

bool parse_encoding(const std::string& text, Encoding& out) {
    if (text == "utf8" || text == "utf-8") out = Encoding::Utf8;
    else if (text == "buffer") out = Encoding::Buffer;
    else if (text == "hex") out = Encoding::Hex;
    else return false;
    return true;
}

const char *encoding_name(Encoding enc) {
    switch (enc) {
        case Encoding::Utf8: return "utf8";
        case Encoding::Buffer: return "buffer";
        case Encoding::Hex: return "hex";
    }
    return "utf8";
}

// Length of the valid UTF-8 sequence starting at s[i], or 0 if malformed.
static size_t valid_sequence(const std::string& s, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c = byte(i);
    if (c < 0x80) return 1;

    size_t len;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0) lo = 0xA0;
        if (c == 0xED) hi = 0x9F; // surrogates
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return len;
}

std::string encode_name(const std::string& raw, Encoding enc) {
    switch (enc) {
        case Encoding::Buffer:
            return raw;
        case Encoding::Hex: {
            static const char digits[] = "0123456789abcdef";
            std::string out;
            out.reserve(raw.size() * 2);
            for (unsigned char c : raw) {
                out.push_back(digits[c >> 4]);
                out.push_back(digits[c & 0x0F]);
            }
            return out;
        }
        case Encoding::Utf8:
            break;
    }

    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size()) {
        size_t len = valid_sequence(raw, i);
        if (len == 0) {
            out += replacement;
            ++i;
        } else {
            out.append(raw, i, len);
            i += len;
        }
    }
    return out;
}

} // namespace asyncfs
