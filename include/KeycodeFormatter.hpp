#pragma once

#include <string>
#include <vector>
#include "KeycodeTypes.hpp"

namespace nexus_keycode {

class KeycodeFormatter {
public:
    // Renders a payload of a keycode family (Full or Small). Carried families
    // must be embedded in their passthrough host first.
    static Keycode format(const AuthenticatedPayload& payload);
    // As above; throws SchemaMismatchError unless the payload belongs to family
    static Keycode format(const AuthenticatedPayload& payload, Family family);

    // XORs every bit before the trailing seed bits with pseudorandom bits
    // derived from the seed. Applying it twice restores the frame.
    static BitString obscure(const BitString& frame, size_t seedBits);

    // Unsigned integer value of bits as exactly digitCount digits, most
    // significant first. Throws EncodingOverflowError if it does not fit.
    static std::vector<uint8_t> toRadix(const BitString& bits, unsigned base, size_t digitCount);
    static size_t digitsRequired(size_t bits, unsigned base);

    // Running check digit over digits (Damm for base 10, 2a+d mod 5 for base 5)
    static uint8_t checkDigit(const std::vector<uint8_t>& digits, unsigned base);

    // Inserts the running check digit after every `interval` digits and
    // after the final partial chunk
    static std::vector<uint8_t> interleaveCheckDigits(const std::vector<uint8_t>& digits,
                                                      unsigned base, size_t interval);

private:
    static uint8_t nextCheckState(uint8_t state, uint8_t digit, unsigned base);
    static Keycode render(const std::vector<uint8_t>& digits, Family family);

    // Prevent instantiation
    KeycodeFormatter() = delete;
    ~KeycodeFormatter() = delete;
};

} // namespace nexus_keycode
