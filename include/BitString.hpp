#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nexus_keycode {

// Ordered bit sequence, most significant bit first
class BitString {
public:
    BitString() = default;
    BitString(uint64_t value, size_t width);

    // Parses "0101..." (whitespace ignored)
    static BitString fromBinary(std::string_view binary);

    // Appends `width` bits of value, MSB first. Throws std::invalid_argument
    // if the value does not fit.
    void append(uint64_t value, size_t width);
    void append(const BitString& other);

    size_t size() const { return bits_.size(); }
    bool empty() const { return bits_.empty(); }
    bool operator[](size_t index) const { return bits_.at(index); }

    BitString slice(size_t offset, size_t width) const;
    uint64_t readUint(size_t offset, size_t width) const;
    uint64_t toUint() const { return readUint(0, size()); }

    // Same length required
    BitString operator^(const BitString& other) const;

    // Big-endian bytes, zero bits added on the left up to a byte boundary.
    // The numeric value is preserved.
    std::vector<uint8_t> toBytes() const;

    // Appends zero bits on the right until size() == width
    BitString paddedTo(size_t width) const;

    std::string toBinary() const;

    bool operator==(const BitString& other) const { return bits_ == other.bits_; }
    bool operator!=(const BitString& other) const { return bits_ != other.bits_; }

private:
    std::vector<bool> bits_;
};

} // namespace nexus_keycode
