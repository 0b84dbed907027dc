#pragma once

#include "KeycodeTypes.hpp"

namespace nexus_keycode {

class PassthroughEncoder {
public:
    // Host passthrough type for a carried payload
    static MessageType hostType(const AuthenticatedPayload& nested);

    // Embeds the nested frame, right-padded with zeros, as the opaque payload
    // field of its host. Throws SchemaMismatchError if the nested message is
    // not of a carried family or does not fit.
    static Body embed(const AuthenticatedPayload& nested);

private:
    static constexpr const char* PAYLOAD_FIELD = "payload";

    // Prevent instantiation
    PassthroughEncoder() = delete;
    ~PassthroughEncoder() = delete;
};

} // namespace nexus_keycode
