#pragma once

#include <string>
#include <string_view>

namespace dlinkwm::common {

// Strict UTF-8 validation: rejects overlong encodings, surrogates and code points past U+10FFFF.
inline bool isValidUtf8(std::string_view input) {
    const unsigned char* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t i = 0;
    const size_t n = input.size();
    while (i < n) {
        unsigned char c = data[i];
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t extra = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            if (c == 0xE0)
                lo = 0xA0; // overlong
            else if (c == 0xED)
                hi = 0x9F; // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            if (c == 0xF0)
                lo = 0x90;
            else if (c == 0xF4)
                hi = 0x8F;
        } else {
            return false;
        }
        if (i + extra >= n) {
            return false;
        }
        unsigned char c1 = data[i + 1];
        if (c1 < lo || c1 > hi) {
            return false;
        }
        for (size_t k = 2; k <= extra; ++k) {
            if ((data[i + k] & 0xC0) != 0x80) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

// Replace invalid UTF-8 byte sequences with '?' so guest-provided text is safe to log.
inline std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    const unsigned char* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t i = 0;
    const size_t n = input.size();
    while (i < n) {
        unsigned char c = data[i];
        size_t len = 1;
        if (c >= 0xC2 && c <= 0xDF)
            len = 2;
        else if (c >= 0xE0 && c <= 0xEF)
            len = 3;
        else if (c >= 0xF0 && c <= 0xF4)
            len = 4;
        else if (c >= 0x80)
            len = 0;

        if (len == 1) {
            out.push_back(static_cast<char>(c));
            ++i;
        } else if (len > 1 && i + len <= n && isValidUtf8(input.substr(i, len))) {
            out.append(input.substr(i, len));
            i += len;
        } else {
            out.push_back('?');
            ++i;
        }
    }

    return out;
}

} // namespace dlinkwm::common
