#include "Authenticator.hpp"
#include "Errors.hpp"
#include "FieldEncoder.hpp"
#include "Protocol.hpp"
#include "Utils.hpp"

namespace nexus_keycode {

namespace {
    uint64_t lowBits(uint64_t value, size_t width) {
        return width >= 64 ? value : value & ((uint64_t{1} << width) - 1);
    }
}

uint64_t Authenticator::computeDigest(uint64_t id, uint8_t opcode, const Body& body,
                                      const SecretKey& key) {
    const MessageDefinition& def = Protocol::definition(body.type);
    if (def.digestBits == 0 || def.digestBits > 64) {
        throw std::logic_error(std::string(def.name) + " carries no digest");
    }

    std::vector<uint8_t> input;
    Utils::appendLittleEndian(input, id, 4);
    input.push_back(opcode);

    size_t offset = 0;
    for (const auto& spec : def.fields) {
        Utils::appendLittleEndian(input, body.bits.readUint(offset, spec.width),
                                  (spec.width + 7) / 8);
        offset += spec.width;
    }

    return Crypto::siphash24(key, input) >> (64 - def.digestBits);
}

void Authenticator::checkReservedPatterns(uint64_t id, const Body& body) {
    FieldValues values;
    for (const auto& pattern : Protocol::reservedPatterns()) {
        if (pattern.type != body.type || (id & pattern.idMask) != pattern.idValue) {
            continue;
        }
        if (values.empty()) {
            values = FieldEncoder::fieldValues(body);
        }
        auto it = values.find(pattern.field);
        if (it != values.end() && it->second == pattern.value) {
            throw IdCollisionError(id, id + 1, "Message id " + std::to_string(id) + " " +
                pattern.reason + "; retry with id " + std::to_string(id + 1));
        }
    }
}

AuthenticatedPayload Authenticator::authenticate(uint64_t id, const Body& body,
                                                 const SecretKey& key) {
    const MessageDefinition& def = Protocol::definition(body.type);

    if (body.bits.size() != def.bodyBits()) {
        throw SchemaMismatchError(std::string("Body length does not match ") + def.name);
    }
    if (id > ProtocolParameters::MAX_MESSAGE_ID) {
        throw FieldRangeError("Message id " + std::to_string(id) + " exceeds 32 bits");
    }
    if (def.fixedId && id != 0) {
        throw FieldRangeError(std::string(def.name) + " requires message id 0");
    }

    checkReservedPatterns(id, body);

    AuthenticatedPayload payload{body.type, id, BitString(def.headerCode, def.headerBits),
                                 body.bits, BitString()};
    payload.header.append(lowBits(id, def.idBits), def.idBits);

    if (def.digestBits == 0) {
        return payload;
    }

    const SecretKey effectiveKey = def.fixedKeyByte ? SecretKey::filled(*def.fixedKeyByte) : key;
    const uint64_t digest = computeDigest(id, def.opcode, body, effectiveKey);

    // A decoder trying every reserved subtype must match exactly one
    for (uint8_t alternative : Protocol::reservedDiscriminators(def.family)) {
        if (alternative == def.opcode) {
            continue;
        }
        if (computeDigest(id, alternative, body, effectiveKey) == digest) {
            throw IdCollisionError(id, id + 1, "Message id " + std::to_string(id) +
                " authenticates as subtype " + std::to_string(alternative) +
                "; retry with id " + std::to_string(id + 1));
        }
    }

    payload.digest = BitString(digest, def.digestBits);
    return payload;
}

} // namespace nexus_keycode
