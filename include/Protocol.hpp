#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "KeycodeTypes.hpp"

namespace nexus_keycode {

// Protocol version
constexpr uint32_t PROTOCOL_VERSION = 1;

// Inclusive range of accepted field values
struct ValueRange {
    uint64_t min;
    uint64_t max;

    bool contains(uint64_t value) const { return value >= min && value <= max; }
};

struct FieldSpec {
    std::string name;
    size_t width;
    // Accepted values; an empty list accepts everything representable in width
    std::vector<ValueRange> domain;

    uint64_t maxValue() const;
    bool accepts(uint64_t value) const;
};

// Rendering properties shared by every message of a family
struct FamilyTraits {
    Family family;
    unsigned base;         // radix of the digit alphabet, 0 for carried families
    char firstSymbol;      // symbol rendered for digit value 0
    size_t checkInterval;  // payload digits per check digit
    bool framed;           // "*DDD DDD ...#"
    size_t groupSize;
    size_t seedBits;       // trailing frame bits that seed obscuring
    bool carried;          // only transmitted inside a passthrough host
    MessageType hostType;  // passthrough type carrying this family
};

struct MessageDefinition {
    MessageType type;
    Family family;
    const char* name;
    uint8_t opcode;        // bound into the digest
    uint8_t headerCode;    // transmitted ahead of the identifier bits
    size_t headerBits;
    size_t idBits;         // identifier low bits transmitted
    bool fixedId;          // identifier must be 0
    size_t digestBits;
    bool obscured;
    size_t digitCount;     // payload digits before check digits; 0 if carried
    std::optional<uint8_t> fixedKeyByte; // key is 16 copies of this byte
    std::vector<FieldSpec> fields;

    size_t bodyBits() const;
    size_t frameBits() const { return headerBits + idBits + bodyBits() + digestBits; }
    const FieldSpec* field(const std::string& name) const;
};

// Transmitted bit pattern a decoder would read as something else
struct ReservedPattern {
    MessageType type;
    uint64_t idMask;
    uint64_t idValue;
    const char* field;
    uint64_t value;
    const char* reason;
};

class Protocol {
public:
    static const MessageDefinition& definition(MessageType type);
    static const FamilyTraits& traits(Family family);
    static const std::vector<MessageType>& messageTypes();
    static std::vector<MessageType> messageTypes(Family family);

    // Subtype opcodes a decoder may try when the digest carries the subtype.
    // Empty for families whose opcode is transmitted.
    static const std::vector<uint8_t>& reservedDiscriminators(Family family);
    static const std::vector<ReservedPattern>& reservedPatterns();

    // Looks a type up by its registry name, e.g. "full.add_credit"
    static std::optional<MessageType> find(const std::string& name);

private:
    // Prevent instantiation
    Protocol() = delete;
    ~Protocol() = delete;
};

} // namespace nexus_keycode
