#pragma once

#include "Crypto.hpp"
#include "KeycodeTypes.hpp"

namespace nexus_keycode {

// One command for one device. Consumed by a single encode.
struct Message {
    MessageType type;
    FieldValues fields;
    uint64_t id;
    SecretKey key;
};

// Bound on IdCollisionError recovery
struct RetryPolicy {
    unsigned maxAttempts = ProtocolParameters::DEFAULT_COLLISION_RETRIES;
};

struct EncodeResult {
    Keycode keycode;
    uint64_t id;        // identifier actually used
    unsigned attempts;
};

class Encoder {
public:
    // Field encoding and authentication of the message itself, without
    // passthrough wrapping
    static AuthenticatedPayload authenticate(const Message& message);

    // Full pipeline. Messages of carried families are wrapped in their
    // passthrough host, authenticated again with the same id and key, and
    // rendered in the host family.
    static Keycode encode(const Message& message);

    // Retries IdCollisionError with the suggested next id until the policy
    // is exhausted, then rethrows the last collision
    static EncodeResult encodeWithRetry(const Message& message,
                                        const RetryPolicy& policy = RetryPolicy());

private:
    // Prevent instantiation
    Encoder() = delete;
    ~Encoder() = delete;
};

} // namespace nexus_keycode
