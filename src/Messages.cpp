#include "Messages.hpp"
#include "Errors.hpp"

namespace nexus_keycode {

namespace {
    // Key placeholder for messages whose definition fixes the key
    SecretKey unusedKey() {
        return SecretKey::filled(0x00);
    }
}

Message FullMessages::addCredit(uint64_t id, uint32_t hours, const SecretKey& key) {
    return Message{MessageType::FullAddCredit, {{"hours", hours}}, id, key};
}

Message FullMessages::setCredit(uint64_t id, uint32_t hours, const SecretKey& key) {
    return Message{MessageType::FullSetCredit, {{"hours", hours}}, id, key};
}

Message FullMessages::unlock(uint64_t id, const SecretKey& key) {
    return setCredit(id, ProtocolParameters::FULL_UNLOCK_HOURS, key);
}

Message FullMessages::wipeState(uint64_t id, FullWipeFlags flags, const SecretKey& key) {
    return Message{MessageType::FullWipeState, {{"flags", static_cast<uint64_t>(flags)}}, id, key};
}

Message FullMessages::factoryAllowTest() {
    return Message{MessageType::FullFactoryAllowTest, {}, 0, unusedKey()};
}

Message FullMessages::factoryOqcTest() {
    return Message{MessageType::FullFactoryOqcTest, {}, 0, unusedKey()};
}

Message FullMessages::factoryDisplayPaygId() {
    return Message{MessageType::FullFactoryDisplayPaygId, {}, 0, unusedKey()};
}

Message FullMessages::passthrough(uint64_t id, uint64_t payload, const SecretKey& key) {
    return Message{MessageType::FullPassthroughCommand, {{"payload", payload}}, id, key};
}

uint8_t SmallMessages::addCreditIncrement(uint32_t days) {
    if (days >= 1 && days <= 180) {
        return static_cast<uint8_t>(days - 1);
    }
    if (days >= 181 && days <= MAX_ADD_CREDIT_DAYS) {
        return static_cast<uint8_t>((days - 181) / 3 + 180);
    }
    throw FieldRangeError("Unsupported add credit days: " + std::to_string(days));
}

uint8_t SmallMessages::setCreditIncrement(uint32_t days) {
    if (days == 0) {
        return LOCK_INCREMENT;
    }
    if (days <= 90) {
        return static_cast<uint8_t>(days - 1);
    }
    if (days <= 180) {
        return static_cast<uint8_t>((days - 91) / 2 + 90);
    }
    if (days <= 360) {
        return static_cast<uint8_t>((days - 181) / 4 + 135);
    }
    if (days <= 720) {
        return static_cast<uint8_t>((days - 361) / 8 + 180);
    }
    if (days <= MAX_SET_CREDIT_DAYS) {
        return static_cast<uint8_t>((days - 721) / 16 + 225);
    }
    throw FieldRangeError("Unsupported set credit days: " + std::to_string(days));
}

Message SmallMessages::addCredit(uint64_t id, uint32_t days, const SecretKey& key) {
    return Message{MessageType::SmallAddCredit, {{"increment", addCreditIncrement(days)}}, id, key};
}

Message SmallMessages::unlock(uint64_t id, const SecretKey& key) {
    return Message{MessageType::SmallAddCredit, {{"increment", UNLOCK_INCREMENT}}, id, key};
}

Message SmallMessages::setCredit(uint64_t id, uint32_t days, const SecretKey& key) {
    return Message{MessageType::SmallSetCredit, {{"increment", setCreditIncrement(days)}}, id, key};
}

Message SmallMessages::lock(uint64_t id, const SecretKey& key) {
    return setCredit(id, 0, key);
}

Message SmallMessages::customCommand(uint64_t id, CustomCommand command, const SecretKey& key) {
    return Message{MessageType::SmallCustomCommand,
                   {{"command", static_cast<uint64_t>(command)}}, id, key};
}

Message SmallMessages::maintenance(MaintenanceFunction function, const SecretKey& key) {
    // MSB set marks maintenance, clear marks test
    const uint64_t body = 0x80U | static_cast<uint64_t>(function);
    return Message{MessageType::SmallMaintenance, {{"function", body}}, 0, key};
}

Message SmallMessages::test(TestFunction function) {
    return Message{MessageType::SmallTest, {{"function", static_cast<uint64_t>(function)}}, 0,
                   unusedKey()};
}

Message SmallMessages::extendedSetCreditWipeRestrictedFlag(uint64_t id, uint32_t days,
                                                           const SecretKey& key) {
    return Message{MessageType::ExtendedSetCreditWipeRestrictedFlag,
                   {{"increment", setCreditIncrement(days)}}, id, key};
}

Message SmallMessages::extendedUnlockWipeRestrictedFlag(uint64_t id, const SecretKey& key) {
    return Message{MessageType::ExtendedSetCreditWipeRestrictedFlag,
                   {{"increment", UNLOCK_INCREMENT}}, id, key};
}

Message SmallMessages::passthrough(uint64_t payload) {
    return Message{MessageType::SmallPassthrough, {{"payload", payload}}, 0, unusedKey()};
}

} // namespace nexus_keycode
