#include "BitString.hpp"
#include <stdexcept>

namespace nexus_keycode {

namespace {
    constexpr size_t MAX_UINT_WIDTH = 64;

    bool fitsWidth(uint64_t value, size_t width) {
        return width >= MAX_UINT_WIDTH || (value >> width) == 0;
    }
}

BitString::BitString(uint64_t value, size_t width) {
    append(value, width);
}

BitString BitString::fromBinary(std::string_view binary) {
    BitString result;
    for (char c : binary) {
        if (c == '0' || c == '1') {
            result.bits_.push_back(c == '1');
        } else if (c != ' ' && c != '_') {
            throw std::invalid_argument("Invalid binary digit");
        }
    }
    return result;
}

void BitString::append(uint64_t value, size_t width) {
    if (width > MAX_UINT_WIDTH) {
        throw std::invalid_argument("Bit width exceeds 64");
    }
    if (!fitsWidth(value, width)) {
        throw std::invalid_argument("Value does not fit bit width");
    }
    for (size_t i = width; i > 0; --i) {
        bits_.push_back(((value >> (i - 1)) & 1U) != 0);
    }
}

void BitString::append(const BitString& other) {
    bits_.insert(bits_.end(), other.bits_.begin(), other.bits_.end());
}

BitString BitString::slice(size_t offset, size_t width) const {
    if (offset > bits_.size() || width > bits_.size() - offset) {
        throw std::out_of_range("BitString slice out of range");
    }
    BitString result;
    result.bits_.assign(bits_.begin() + offset, bits_.begin() + offset + width);
    return result;
}

uint64_t BitString::readUint(size_t offset, size_t width) const {
    if (width > MAX_UINT_WIDTH) {
        throw std::invalid_argument("Bit width exceeds 64");
    }
    if (offset > bits_.size() || width > bits_.size() - offset) {
        throw std::out_of_range("BitString read out of range");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 1) | (bits_[offset + i] ? 1U : 0U);
    }
    return value;
}

BitString BitString::operator^(const BitString& other) const {
    if (other.size() != size()) {
        throw std::invalid_argument("BitString length mismatch");
    }
    BitString result;
    result.bits_.reserve(bits_.size());
    for (size_t i = 0; i < bits_.size(); ++i) {
        result.bits_.push_back(bits_[i] != other.bits_[i]);
    }
    return result;
}

std::vector<uint8_t> BitString::toBytes() const {
    const size_t byteCount = (bits_.size() + 7) / 8;
    const size_t padding = byteCount * 8 - bits_.size();

    std::vector<uint8_t> bytes(byteCount, 0);
    for (size_t i = 0; i < bits_.size(); ++i) {
        if (bits_[i]) {
            const size_t position = i + padding;
            bytes[position / 8] |= static_cast<uint8_t>(0x80U >> (position % 8));
        }
    }
    return bytes;
}

BitString BitString::paddedTo(size_t width) const {
    if (width < bits_.size()) {
        throw std::invalid_argument("BitString longer than padded width");
    }
    BitString result = *this;
    result.bits_.resize(width, false);
    return result;
}

std::string BitString::toBinary() const {
    std::string result;
    result.reserve(bits_.size());
    for (bool bit : bits_) {
        result.push_back(bit ? '1' : '0');
    }
    return result;
}

} // namespace nexus_keycode
