#include "Utf8.hpp"
#include <cstdint>

// Desc: validate a byte range as well-formed UTF-8 (RFC 3629)
// In: const char* data, size_t len
// Out: bool (true if every sequence is well-formed)
bool is_valid_utf8(const char* data, std::size_t len) noexcept {
    const auto* p   = reinterpret_cast<const unsigned char*>(data);
    const auto* end = p + len;

    while (p < end) {
        const unsigned char c = *p;
        if (c < 0x80) { ++p; continue; }

        std::size_t   need = 0;
        std::uint32_t cp   = 0;
        std::uint32_t min  = 0;
        if      ((c & 0xE0) == 0xC0) { need = 1; cp = c & 0x1F; min = 0x80; }
        else if ((c & 0xF0) == 0xE0) { need = 2; cp = c & 0x0F; min = 0x800; }
        else if ((c & 0xF8) == 0xF0) { need = 3; cp = c & 0x07; min = 0x10000; }
        else return false;   // stray continuation byte or 0xF8..0xFF

        if (static_cast<std::size_t>(end - p) <= need) return false;
        for (std::size_t i = 1; i <= need; ++i) {
            if ((p[i] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i] & 0x3F);
        }
        if (cp < min) return false;                       // overlong
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;   // surrogate
        p += need + 1;
    }
    return true;
}
