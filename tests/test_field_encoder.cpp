#include <doctest/doctest.h>
#include "Errors.hpp"
#include "FieldEncoder.hpp"

using namespace nexus_keycode;

TEST_CASE("Largest value succeeds, one more fails") {
    CHECK(FieldEncoder::encodeBody(MessageType::FullAddCredit, {{"hours", 99999}}).bits.size() == 17);
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::FullAddCredit, {{"hours", 100000}}),
                    FieldRangeError);

    CHECK_NOTHROW(FieldEncoder::encodeBody(MessageType::FullWipeState, {{"flags", 2}}));
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::FullWipeState, {{"flags", 3}}),
                    FieldRangeError);

    CHECK_NOTHROW(FieldEncoder::encodeBody(MessageType::SmallAddCredit, {{"increment", 255}}));
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::SmallAddCredit, {{"increment", 256}}),
                    FieldRangeError);
}

TEST_CASE("Enumerated domains reject values between their ranges") {
    CHECK_NOTHROW(FieldEncoder::encodeBody(MessageType::SmallSetCredit, {{"increment", 239}}));
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::SmallSetCredit, {{"increment", 240}}),
                    FieldRangeError);
    CHECK_NOTHROW(FieldEncoder::encodeBody(MessageType::SmallSetCredit, {{"increment", 254}}));

    CHECK_NOTHROW(FieldEncoder::encodeBody(MessageType::SmallMaintenance, {{"function", 130}}));
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::SmallMaintenance, {{"function", 131}}),
                    FieldRangeError);
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::SmallTest, {{"function", 2}}),
                    FieldRangeError);
}

TEST_CASE("Field names must match the schema") {
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::FullAddCredit, {}), SchemaMismatchError);
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::FullAddCredit,
                                             {{"hours", 1}, {"minutes", 1}}),
                    SchemaMismatchError);
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::FullFactoryOqcTest, {{"reserved", 0}}),
                    SchemaMismatchError);
    CHECK(FieldEncoder::encodeBody(MessageType::FullFactoryOqcTest, {}).bits.empty());
}

TEST_CASE("Schema errors are reported before range errors") {
    CHECK_THROWS_AS(FieldEncoder::encodeBody(MessageType::OriginUnlockAccessory,
                                             {{"accessory_digit", 99}}),
                    SchemaMismatchError);
}

TEST_CASE("Fields are packed in declaration order") {
    const Body body = FieldEncoder::encodeBody(MessageType::OriginLinkAccessoryMode3,
        {{"auth", 1}, {"challenge", 2}, {"accessory_digit", 9}});
    REQUIRE(body.bits.size() == 44);
    CHECK(body.bits.readUint(0, 4) == 9);
    CHECK(body.bits.readUint(4, 20) == 2);
    CHECK(body.bits.readUint(24, 20) == 1);

    const FieldValues values = FieldEncoder::fieldValues(body);
    CHECK(values.at("accessory_digit") == 9);
    CHECK(values.at("challenge") == 2);
    CHECK(values.at("auth") == 1);
}

TEST_CASE("Reading a body of the wrong length fails") {
    const Body body{MessageType::FullWipeState, BitString(1, 3)};
    CHECK_THROWS_AS(FieldEncoder::fieldValues(body), SchemaMismatchError);
}
