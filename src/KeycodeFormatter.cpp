#include "KeycodeFormatter.hpp"
#include "Crypto.hpp"
#include "Errors.hpp"
#include "Protocol.hpp"
#include <openssl/bn.h>

namespace nexus_keycode {

namespace {
    // Totally anti-symmetric quasigroup of order 10
    constexpr uint8_t DAMM_TABLE[10][10] = {
        {0, 3, 1, 7, 5, 9, 8, 6, 4, 2},
        {7, 0, 9, 2, 1, 5, 4, 8, 6, 3},
        {4, 2, 0, 6, 8, 7, 1, 3, 5, 9},
        {1, 7, 5, 0, 9, 8, 3, 4, 2, 6},
        {6, 1, 2, 3, 0, 4, 5, 9, 7, 8},
        {3, 6, 7, 4, 2, 0, 9, 5, 8, 1},
        {5, 8, 6, 9, 7, 2, 0, 1, 3, 4},
        {8, 9, 4, 5, 3, 6, 2, 0, 1, 7},
        {9, 4, 3, 8, 6, 1, 7, 2, 0, 5},
        {2, 5, 8, 1, 4, 3, 6, 7, 9, 0}
    };

    class ScopedBIGNUM {
    public:
        explicit ScopedBIGNUM(BIGNUM* bn) : bn_(bn) {
            if (!bn_) Crypto::handleOpenSSLError("BIGNUM allocation");
        }
        ~ScopedBIGNUM() { BN_free(bn_); }
        BIGNUM* get() { return bn_; }
    private:
        BIGNUM* bn_;
    };

    BN_ULONG divideWord(BIGNUM* bn, unsigned base) {
        BN_ULONG remainder = BN_div_word(bn, base);
        if (remainder == static_cast<BN_ULONG>(-1)) {
            Crypto::handleOpenSSLError("BN_div_word");
        }
        return remainder;
    }
}

Keycode KeycodeFormatter::format(const AuthenticatedPayload& payload) {
    const MessageDefinition& def = Protocol::definition(payload.type);
    const FamilyTraits& traits = Protocol::traits(def.family);
    if (traits.carried) {
        throw SchemaMismatchError(std::string(def.name) +
            " is only sent inside a passthrough message");
    }

    BitString frame = payload.frame();
    if (frame.size() != def.frameBits()) {
        throw SchemaMismatchError(std::string("Frame length does not match ") + def.name);
    }
    if (def.obscured) {
        frame = obscure(frame, traits.seedBits);
    }

    const std::vector<uint8_t> digits = toRadix(frame, traits.base, def.digitCount);
    return render(interleaveCheckDigits(digits, traits.base, traits.checkInterval), def.family);
}

Keycode KeycodeFormatter::format(const AuthenticatedPayload& payload, Family family) {
    const MessageDefinition& def = Protocol::definition(payload.type);
    if (def.family != family) {
        throw SchemaMismatchError(std::string(def.name) + " is not a " + toString(family) +
            " message");
    }
    return format(payload);
}

BitString KeycodeFormatter::obscure(const BitString& frame, size_t seedBits) {
    if (seedBits > frame.size()) {
        throw std::invalid_argument("Seed longer than frame");
    }
    const size_t maskedBits = frame.size() - seedBits;
    const BitString seed = frame.slice(maskedBits, seedBits);

    BitString result = frame.slice(0, maskedBits) ^ Crypto::pseudorandomBits(seed, maskedBits);
    result.append(seed);
    return result;
}

std::vector<uint8_t> KeycodeFormatter::toRadix(const BitString& bits, unsigned base,
                                               size_t digitCount) {
    if (base < 2) {
        throw std::invalid_argument("Radix must be at least 2");
    }

    const std::vector<uint8_t> bytes = bits.toBytes();
    ScopedBIGNUM value(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));

    std::vector<uint8_t> digits(digitCount, 0);
    for (size_t i = digitCount; i > 0; --i) {
        digits[i - 1] = static_cast<uint8_t>(divideWord(value.get(), base));
    }

    if (!BN_is_zero(value.get())) {
        throw EncodingOverflowError(std::to_string(bits.size()) + "-bit value needs more than " +
            std::to_string(digitCount) + " base-" + std::to_string(base) + " digits");
    }
    return digits;
}

size_t KeycodeFormatter::digitsRequired(size_t bits, unsigned base) {
    if (base < 2) {
        throw std::invalid_argument("Radix must be at least 2");
    }

    // Count the digits of the largest value, 2^bits - 1
    ScopedBIGNUM value(BN_new());
    if (bits > 0) {
        if (!BN_set_bit(value.get(), static_cast<int>(bits)) ||
            !BN_sub_word(value.get(), 1)) {
            Crypto::handleOpenSSLError("BN_set_bit");
        }
    }

    size_t digits = 0;
    while (!BN_is_zero(value.get())) {
        divideWord(value.get(), base);
        ++digits;
    }
    return digits;
}

uint8_t KeycodeFormatter::nextCheckState(uint8_t state, uint8_t digit, unsigned base) {
    if (digit >= base) {
        throw std::invalid_argument("Digit out of range for radix");
    }
    switch (base) {
        case 10:
            return DAMM_TABLE[state][digit];
        case 5:
            return static_cast<uint8_t>((2 * state + digit) % 5);
        default:
            throw std::invalid_argument("No check digit scheme for base " + std::to_string(base));
    }
}

uint8_t KeycodeFormatter::checkDigit(const std::vector<uint8_t>& digits, unsigned base) {
    uint8_t state = 0;
    for (uint8_t digit : digits) {
        state = nextCheckState(state, digit, base);
    }
    return state;
}

std::vector<uint8_t> KeycodeFormatter::interleaveCheckDigits(const std::vector<uint8_t>& digits,
                                                             unsigned base, size_t interval) {
    if (interval == 0) {
        throw std::invalid_argument("Check digit interval must be positive");
    }

    std::vector<uint8_t> result;
    result.reserve(digits.size() + digits.size() / interval + 1);

    uint8_t state = 0;
    for (size_t i = 0; i < digits.size(); ++i) {
        state = nextCheckState(state, digits[i], base);
        result.push_back(digits[i]);
        if ((i + 1) % interval == 0 || i + 1 == digits.size()) {
            result.push_back(state);
        }
    }
    return result;
}

Keycode KeycodeFormatter::render(const std::vector<uint8_t>& digits, Family family) {
    const FamilyTraits& traits = Protocol::traits(family);

    Keycode keycode{family, std::string(), std::string()};
    keycode.digits.reserve(digits.size());
    for (uint8_t digit : digits) {
        keycode.digits.push_back(static_cast<char>(traits.firstSymbol + digit));
    }

    if (!traits.framed) {
        keycode.text = keycode.digits;
        return keycode;
    }

    keycode.text = "*";
    for (size_t i = 0; i < keycode.digits.size(); i += traits.groupSize) {
        if (i > 0) {
            keycode.text += ' ';
        }
        keycode.text += keycode.digits.substr(i, traits.groupSize);
    }
    keycode.text += '#';
    return keycode;
}

} // namespace nexus_keycode
