#pragma once

#include "Crypto.hpp"
#include "KeycodeTypes.hpp"

namespace nexus_keycode {

class Authenticator {
public:
    // Binds the identifier and body to a truncated SipHash-2-4 digest and
    // builds the transmitted header.
    // Throws FieldRangeError for identifiers the message cannot carry and
    // IdCollisionError when the result would be ambiguous to a decoder.
    static AuthenticatedPayload authenticate(uint64_t id, const Body& body, const SecretKey& key);

    // Digest over id (u32 LE) | opcode (u8) | each field LE in whole bytes,
    // truncated to the most significant digest bits of the definition
    static uint64_t computeDigest(uint64_t id, uint8_t opcode, const Body& body,
                                  const SecretKey& key);

private:
    static void checkReservedPatterns(uint64_t id, const Body& body);

    // Prevent instantiation
    Authenticator() = delete;
    ~Authenticator() = delete;
};

} // namespace nexus_keycode
