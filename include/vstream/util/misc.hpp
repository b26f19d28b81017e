#pragma once
#include "vstream/config.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace vstream::util {
/**
 * Convert a hex value to a decimal value.
 *
 * @param c The hexadecimal input.
 * @return The decimal output, or 0xff if `c` is not a hex digit.
 */
static inline std::uint8_t hex2dec(std::uint8_t c)
{
    if (c >= '0' && c <= '9')
        return c - '0';

    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;

    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;

    return 0xff;
}

/**
 * Decodes an URL.
 *
 * @details This function replaces %<hex> with the corresponding characters.
 *          A '%' that is not followed by two hex digits is kept verbatim.
 *
 * @note As the replaced characters are "shorter" than the original input we can perform
 * the replacement in-place.
 *
 * @param str The string to decode.
 */
static inline void url_decode(std::string& str)
{
    size_t w = 0;
    for (size_t r = 0; r < str.size(); ++r) {
        uint8_t v = str[r];
        if (str[r] == '%' && r + 2 < str.size()) {
            auto hi = hex2dec(str[r + 1]);
            auto lo = hex2dec(str[r + 2]);
            if (hi != 0xff && lo != 0xff) {
                v = (hi << 4) | lo;
                r += 2;
            }
        }
        str[w++] = v;
    }
    str.resize(w);
}
static inline std::string url_decode(std::string_view str)
{
    std::string decode_str(str);
    url_decode(decode_str);
    return decode_str;
}

} // namespace vstream::util
