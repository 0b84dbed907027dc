#pragma once // Ensures this header is included only once during compilation

#include <string>  // Provides the std::string type
#include <map>     // Provides the std::map container used for field values
#include <cstdint> // Provides fixed-width integer types like uint64_t
#include "BitString.hpp"

namespace nexus_keycode { // Begin namespace nexus_keycode to group related functionality

// Error codes for the keycode encoder
enum class ErrorCode {
    None = 0,
    FieldRange,
    SchemaMismatch,
    IdCollision,
    EncodingOverflow,
    InvalidKey,
    CryptoFailure,
    InvalidParameter
};

// Converts an ErrorCode to a human-readable string
inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "No error";
        case ErrorCode::FieldRange:
            return "Field Range"; // A field value does not fit its width or domain
        case ErrorCode::SchemaMismatch:
            return "Schema Mismatch"; // Supplied fields do not match the message schema
        case ErrorCode::IdCollision:
            return "Id Collision"; // Identifier yields an ambiguous keycode
        case ErrorCode::EncodingOverflow:
            return "Encoding Overflow"; // Registry digit count too small for the frame
        case ErrorCode::InvalidKey:
            return "Invalid Key";
        case ErrorCode::CryptoFailure:
            return "Crypto Failure"; // OpenSSL reported an error
        case ErrorCode::InvalidParameter:
            return "Invalid Parameter";
        default:
            return "Unknown error";
    }
}

// Protocol families. Full and Small render keycodes; the other two are only
// ever carried inside a passthrough message of their host family.
enum class Family : uint8_t {
    Full,
    Small,
    SmallExtended,
    ChannelOrigin
};

inline const char* toString(Family family) {
    switch (family) {
        case Family::Full:          return "Full";
        case Family::Small:         return "Small";
        case Family::SmallExtended: return "SmallExtended";
        case Family::ChannelOrigin: return "ChannelOrigin";
        default:                    return "Unknown";
    }
}

// Every message the encoder can produce. The order must match the registry
// table in Protocol.cpp.
enum class MessageType : uint8_t {
    FullAddCredit = 0,
    FullSetCredit,
    FullWipeState,
    FullFactoryAllowTest,
    FullFactoryOqcTest,
    FullFactoryDisplayPaygId,
    FullPassthroughCommand,
    SmallAddCredit,
    SmallSetCredit,
    SmallCustomCommand,
    SmallMaintenance,
    SmallTest,
    SmallPassthrough,
    ExtendedSetCreditWipeRestrictedFlag,
    OriginGenericControllerAction,
    OriginUnlockAccessory,
    OriginUnlinkAccessory,
    OriginLinkAccessoryMode3
};

// Field name -> value. Names must match the FieldSpec list of the type.
using FieldValues = std::map<std::string, uint64_t>;

// Packed fields of one message, in declaration order
struct Body {
    MessageType type;
    BitString bits;
};

// Everything the formatter needs: transmitted header (opcode and identifier
// low bits), the body and the truncated digest.
struct AuthenticatedPayload {
    MessageType type;
    uint64_t id;
    BitString header;
    BitString body;
    BitString digest;

    // header | body | digest
    BitString frame() const {
        BitString bits = header;
        bits.append(body);
        bits.append(digest);
        return bits;
    }
};

// Rendered keycode
struct Keycode {
    Family family;
    std::string digits; // payload and check digits, no framing
    std::string text;   // what the user types
};

// Constants shared by every protocol family
struct ProtocolParameters {
    static constexpr uint64_t MAX_MESSAGE_ID = 0xFFFFFFFFULL; // 32-bit counter
    static constexpr size_t SECRET_KEY_SIZE = 16;             // SipHash key
    static constexpr unsigned DEFAULT_COLLISION_RETRIES = 8;
    static constexpr uint32_t FULL_UNLOCK_HOURS = 99999;
};

} // namespace nexus_keycode
