#include <doctest/doctest.h>
#include "BitString.hpp"

using namespace nexus_keycode;

TEST_CASE("Values are appended most significant bit first") {
    BitString bits(0b101, 3);
    bits.append(0x3, 4);
    CHECK(bits.toBinary() == "1010011");
    CHECK(bits.size() == 7);
    CHECK(bits.toUint() == 0b1010011);
    CHECK(bits.readUint(1, 3) == 0b010);
}

TEST_CASE("Appending a value wider than its field is rejected") {
    BitString bits;
    CHECK_THROWS_AS(bits.append(8, 3), std::invalid_argument);
    CHECK_THROWS_AS(bits.append(1, 65), std::invalid_argument);
    CHECK(bits.empty());

    bits.append(UINT64_MAX, 64);
    CHECK(bits.size() == 64);
    CHECK(bits.toUint() == UINT64_MAX);
}

TEST_CASE("Binary text parses and ignores separators") {
    CHECK(BitString::fromBinary("1010 0110").toUint() == 0xA6);
    CHECK(BitString::fromBinary("1_1").size() == 2);
    CHECK_THROWS_AS(BitString::fromBinary("102"), std::invalid_argument);
}

TEST_CASE("Byte conversion pads on the left and keeps the value") {
    CHECK(BitString::fromBinary("0110").toBytes() == std::vector<uint8_t>{0x06});
    CHECK(BitString(0x6FA, 12).toBytes() == std::vector<uint8_t>{0x06, 0xFA});
    CHECK(BitString(0x06FA, 16).toBytes() == std::vector<uint8_t>{0x06, 0xFA});
    CHECK(BitString().toBytes().empty());
}

TEST_CASE("Slicing and padding") {
    const BitString bits = BitString::fromBinary("110010");
    CHECK(bits.slice(2, 3).toBinary() == "001");
    CHECK(bits.slice(6, 0).empty());
    CHECK_THROWS_AS(bits.slice(4, 3), std::out_of_range);

    CHECK(bits.paddedTo(8).toBinary() == "11001000");
    CHECK_THROWS_AS(bits.paddedTo(5), std::invalid_argument);
}

TEST_CASE("XOR requires equal lengths") {
    const BitString a = BitString::fromBinary("1100");
    const BitString b = BitString::fromBinary("1010");
    CHECK((a ^ b).toBinary() == "0110");
    CHECK(((a ^ b) ^ b) == a);
    CHECK_THROWS_AS(a ^ BitString::fromBinary("1"), std::invalid_argument);
}
