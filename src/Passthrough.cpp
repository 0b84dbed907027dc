#include "Passthrough.hpp"
#include "Errors.hpp"
#include "FieldEncoder.hpp"
#include "Protocol.hpp"

namespace nexus_keycode {

MessageType PassthroughEncoder::hostType(const AuthenticatedPayload& nested) {
    const MessageDefinition& def = Protocol::definition(nested.type);
    const FamilyTraits& traits = Protocol::traits(def.family);
    if (!traits.carried) {
        throw SchemaMismatchError(std::string(def.name) + " cannot be carried in a passthrough");
    }
    return traits.hostType;
}

Body PassthroughEncoder::embed(const AuthenticatedPayload& nested) {
    const MessageType host = hostType(nested);
    const FieldSpec* payloadSpec = Protocol::definition(host).field(PAYLOAD_FIELD);
    if (!payloadSpec) {
        throw std::logic_error("Passthrough host has no payload field");
    }

    const BitString frame = nested.frame();
    if (frame.size() > payloadSpec->width) {
        throw SchemaMismatchError(std::to_string(frame.size()) + "-bit " +
            Protocol::definition(nested.type).name + " exceeds the " +
            std::to_string(payloadSpec->width) + "-bit passthrough payload");
    }

    return FieldEncoder::encodeBody(host, {{PAYLOAD_FIELD, frame.paddedTo(payloadSpec->width).toUint()}});
}

} // namespace nexus_keycode
