#include "FieldEncoder.hpp"
#include "Errors.hpp"
#include "Protocol.hpp"

namespace nexus_keycode {

Body FieldEncoder::encodeBody(MessageType type, const FieldValues& values) {
    const MessageDefinition& def = Protocol::definition(type);

    for (const auto& entry : values) {
        if (!def.field(entry.first)) {
            throw SchemaMismatchError("Unexpected field '" + entry.first +
                "' for " + def.name);
        }
    }

    for (const auto& spec : def.fields) {
        auto it = values.find(spec.name);
        if (it == values.end()) {
            throw SchemaMismatchError("Missing field '" + spec.name + "' for " + def.name);
        }
        if (!spec.accepts(it->second)) {
            throw FieldRangeError("Value " + std::to_string(it->second) +
                " out of range for field '" + spec.name + "' of " + def.name);
        }
    }

    Body body{type, BitString()};
    for (const auto& spec : def.fields) {
        body.bits.append(values.at(spec.name), spec.width);
    }
    return body;
}

FieldValues FieldEncoder::fieldValues(const Body& body) {
    const MessageDefinition& def = Protocol::definition(body.type);
    if (body.bits.size() != def.bodyBits()) {
        throw SchemaMismatchError(std::string("Body length does not match ") + def.name);
    }

    FieldValues values;
    size_t offset = 0;
    for (const auto& spec : def.fields) {
        values[spec.name] = body.bits.readUint(offset, spec.width);
        offset += spec.width;
    }
    return values;
}

} // namespace nexus_keycode
