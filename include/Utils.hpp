#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace nexus_keycode {

class Utils {
public:
    // Hex decoding via OpenSSL; throws std::invalid_argument on bad input
    static std::vector<uint8_t> parseHex(std::string_view hex);

    // Appends the low `count` bytes of value, least significant first
    static void appendLittleEndian(std::vector<uint8_t>& out, uint64_t value, size_t count);

    // Decimal (leading zeros allowed) or 0x-prefixed hexadecimal, bounded by maxValue
    static uint64_t parseUnsigned(std::string_view text, uint64_t maxValue);

private:
    // Prevent instantiation
    Utils() = delete;
    ~Utils() = delete;
};

} // namespace nexus_keycode
