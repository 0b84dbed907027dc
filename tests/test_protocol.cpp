#include <doctest/doctest.h>
#include "KeycodeFormatter.hpp"
#include "Protocol.hpp"

using namespace nexus_keycode;

TEST_CASE("Every message type has a definition") {
    const auto& types = Protocol::messageTypes();
    REQUIRE(types.size() == 18);
    for (size_t i = 0; i < types.size(); ++i) {
        CHECK(static_cast<size_t>(types[i]) == i);
        CHECK(Protocol::definition(types[i]).type == types[i]);
    }
}

TEST_CASE("Registry names resolve back to their types") {
    for (MessageType type : Protocol::messageTypes()) {
        auto found = Protocol::find(Protocol::definition(type).name);
        REQUIRE(found.has_value());
        CHECK(*found == type);
    }
    CHECK_FALSE(Protocol::find("full.reserved").has_value());
}

TEST_CASE("Rendered message types reserve exactly the digits their frame needs") {
    for (Family family : {Family::Full, Family::Small}) {
        const FamilyTraits& traits = Protocol::traits(family);
        for (MessageType type : Protocol::messageTypes(family)) {
            const MessageDefinition& def = Protocol::definition(type);
            CAPTURE(def.name);
            CHECK(KeycodeFormatter::digitsRequired(def.frameBits(), traits.base) == def.digitCount);
        }
    }
}

TEST_CASE("Small family frames are 28 bits") {
    for (MessageType type : Protocol::messageTypes(Family::Small)) {
        CAPTURE(Protocol::definition(type).name);
        CHECK(Protocol::definition(type).frameBits() == 28);
    }
}

TEST_CASE("Carried families fit their passthrough payload") {
    for (Family family : {Family::SmallExtended, Family::ChannelOrigin}) {
        const FamilyTraits& traits = Protocol::traits(family);
        REQUIRE(traits.carried);
        const FieldSpec* payload = Protocol::definition(traits.hostType).field("payload");
        REQUIRE(payload != nullptr);
        for (MessageType type : Protocol::messageTypes(family)) {
            CAPTURE(Protocol::definition(type).name);
            CHECK(Protocol::definition(type).digitCount == 0);
            CHECK(Protocol::definition(type).frameBits() <= payload->width);
        }
    }
    CHECK(Protocol::definition(MessageType::ExtendedSetCreditWipeRestrictedFlag).frameBits() == 26);
}

TEST_CASE("Field domains are representable in their widths") {
    for (MessageType type : Protocol::messageTypes()) {
        for (const auto& spec : Protocol::definition(type).fields) {
            CAPTURE(spec.name);
            for (const auto& range : spec.domain) {
                CHECK(range.min <= range.max);
                CHECK(range.max <= spec.maxValue());
            }
        }
    }
}

TEST_CASE("Set credit and custom command share an opcode with disjoint bodies") {
    const auto& setCredit = Protocol::definition(MessageType::SmallSetCredit);
    const auto& custom = Protocol::definition(MessageType::SmallCustomCommand);
    CHECK(setCredit.opcode == custom.opcode);
    for (uint64_t value = 0; value <= 255; ++value) {
        CHECK_FALSE((setCredit.fields[0].accepts(value) && custom.fields[0].accepts(value)));
    }
}

TEST_CASE("Only the extended family reserves discriminators") {
    const auto& subtypes = Protocol::reservedDiscriminators(Family::SmallExtended);
    CHECK(subtypes.size() == 8);
    CHECK(subtypes.front() == Protocol::definition(MessageType::ExtendedSetCreditWipeRestrictedFlag).opcode);
    CHECK(Protocol::reservedDiscriminators(Family::Full).empty());
    CHECK(Protocol::reservedDiscriminators(Family::Small).empty());
}

TEST_CASE("Factory and test messages fix their identifier and key") {
    for (MessageType type : {MessageType::FullFactoryAllowTest, MessageType::FullFactoryOqcTest,
                             MessageType::FullFactoryDisplayPaygId}) {
        const auto& def = Protocol::definition(type);
        CHECK(def.fixedId);
        CHECK(def.idBits == 0);
        CHECK_FALSE(def.obscured);
        REQUIRE(def.fixedKeyByte.has_value());
        CHECK(*def.fixedKeyByte == 0x00);
    }
    const auto& test = Protocol::definition(MessageType::SmallTest);
    CHECK(test.fixedId);
    REQUIRE(test.fixedKeyByte.has_value());
    CHECK(*test.fixedKeyByte == 0xFF);
}
