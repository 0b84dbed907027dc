#include "Utils.hpp"
#include <cctype>
#include <openssl/crypto.h>
#include <stdexcept>

namespace nexus_keycode {

std::vector<uint8_t> Utils::parseHex(std::string_view hex) {
    if (hex.empty() || hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string must have an even, non-zero length");
    }

    // OPENSSL_hexstr2buf needs a NUL-terminated string
    const std::string text(hex);
    long length = 0;
    unsigned char* buffer = OPENSSL_hexstr2buf(text.c_str(), &length);
    if (!buffer) {
        throw std::invalid_argument("Invalid hex string");
    }

    std::vector<uint8_t> bytes(buffer, buffer + length);
    OPENSSL_clear_free(buffer, static_cast<size_t>(length));
    return bytes;
}

void Utils::appendLittleEndian(std::vector<uint8_t>& out, uint64_t value, size_t count) {
    if (count > sizeof(uint64_t)) {
        throw std::invalid_argument("Little-endian width exceeds 8 bytes");
    }
    for (size_t i = 0; i < count; ++i) {
        out.push_back(static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    }
}

uint64_t Utils::parseUnsigned(std::string_view text, uint64_t maxValue) {
    const std::string value(text);

    // Leading zeros stay decimal; only an explicit 0x prefix selects hex
    int base = 10;
    std::string digits = value;
    if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        base = 16;
        digits = value.substr(2);
    }

    const auto isDigit = [base](char c) {
        return base == 16 ? std::isxdigit(static_cast<unsigned char>(c)) != 0
                          : std::isdigit(static_cast<unsigned char>(c)) != 0;
    };
    if (digits.empty() || !isDigit(digits[0])) {
        throw std::invalid_argument("Expected an unsigned number: " + value);
    }

    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(digits, &consumed, base);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("Expected an unsigned number: " + value);
    } catch (const std::out_of_range&) {
        throw std::out_of_range("Number exceeds " + std::to_string(maxValue) + ": " + value);
    }
    if (consumed != digits.size()) {
        throw std::invalid_argument("Trailing characters in number: " + value);
    }
    if (parsed > maxValue) {
        throw std::out_of_range("Number exceeds " + std::to_string(maxValue) + ": " + value);
    }
    return parsed;
}

} // namespace nexus_keycode
