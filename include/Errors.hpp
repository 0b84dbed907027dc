#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include "KeycodeTypes.hpp"

namespace nexus_keycode {

// Base class for every encoding failure. A failure never yields a keycode.
class KeycodeError : public std::runtime_error {
public:
    KeycodeError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// A value does not fit its field's width or enumerated domain
class FieldRangeError : public KeycodeError {
public:
    explicit FieldRangeError(const std::string& message)
        : KeycodeError(ErrorCode::FieldRange, message) {}
};

// Field names do not match the schema, or a message type is used outside
// the family that carries it
class SchemaMismatchError : public KeycodeError {
public:
    explicit SchemaMismatchError(const std::string& message)
        : KeycodeError(ErrorCode::SchemaMismatch, message) {}
};

// The identifier produces a keycode the decoder could read as a different
// command. Callers retry with nextId().
class IdCollisionError : public KeycodeError {
public:
    IdCollisionError(uint64_t id, uint64_t nextId, const std::string& message)
        : KeycodeError(ErrorCode::IdCollision, message), id_(id), nextId_(nextId) {}

    uint64_t id() const noexcept { return id_; }
    uint64_t nextId() const noexcept { return nextId_; }

private:
    uint64_t id_;
    uint64_t nextId_;
};

// Radix conversion needs more digits than the registry allows
class EncodingOverflowError : public KeycodeError {
public:
    explicit EncodingOverflowError(const std::string& message)
        : KeycodeError(ErrorCode::EncodingOverflow, message) {}
};

} // namespace nexus_keycode
