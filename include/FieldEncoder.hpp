#pragma once

#include "KeycodeTypes.hpp"

namespace nexus_keycode {

class FieldEncoder {
public:
    // Packs field values MSB first in declaration order.
    // Throws SchemaMismatchError for missing or unexpected fields and
    // FieldRangeError for values outside a field's domain; nothing is packed
    // until every value has been checked.
    static Body encodeBody(MessageType type, const FieldValues& values);

    // Reads the values back out of a body
    static FieldValues fieldValues(const Body& body);

private:
    // Prevent instantiation
    FieldEncoder() = delete;
    ~FieldEncoder() = delete;
};

} // namespace nexus_keycode
