#include "ChannelOrigin.hpp"
#include "Errors.hpp"
#include "Protocol.hpp"
#include "Utils.hpp"

namespace nexus_keycode {

namespace {
    void checkCount(uint64_t count, const char* what) {
        if (count > ProtocolParameters::MAX_MESSAGE_ID) {
            throw FieldRangeError(std::string(what) + " exceeds 32 bits");
        }
    }

    void checkAccessoryId(uint64_t accessoryId) {
        if (accessoryId > ChannelOrigin::MAX_ACCESSORY_ID) {
            throw FieldRangeError("Accessory id exceeds 48 bits");
        }
    }
}

uint32_t ChannelOrigin::authDigits(const SecretKey& key, const std::vector<uint8_t>& input) {
    return static_cast<uint32_t>((Crypto::siphash24(key, input) & 0xFFFFFFFFULL) % AUTH_MODULUS);
}

uint8_t ChannelOrigin::accessoryDigit(uint64_t accessoryId) {
    checkAccessoryId(accessoryId);
    return static_cast<uint8_t>((accessoryId & 0xFFFFFFFFULL) % 10);
}

uint32_t ChannelOrigin::genericActionAuth(uint64_t controllerCount, GenericAction action,
                                          const SecretKey& controllerKey) {
    checkCount(controllerCount, "Controller command count");

    // count | command type | action | action data (unused)
    std::vector<uint8_t> input;
    Utils::appendLittleEndian(input, controllerCount, 4);
    Utils::appendLittleEndian(input,
        Protocol::definition(MessageType::OriginGenericControllerAction).opcode, 1);
    Utils::appendLittleEndian(input, static_cast<uint64_t>(action), 2);
    Utils::appendLittleEndian(input, 0, 2);
    return authDigits(controllerKey, input);
}

uint32_t ChannelOrigin::specificAccessoryAuth(MessageType type, uint64_t accessoryId,
                                              uint64_t controllerCount,
                                              const SecretKey& controllerKey) {
    if (type != MessageType::OriginUnlockAccessory && type != MessageType::OriginUnlinkAccessory) {
        throw SchemaMismatchError("Not an accessory-specific command");
    }
    checkCount(controllerCount, "Controller command count");
    checkAccessoryId(accessoryId);

    // The controller expands the transmitted digit to the full id of a
    // linked accessory before checking this
    std::vector<uint8_t> input;
    Utils::appendLittleEndian(input, controllerCount, 4);
    Utils::appendLittleEndian(input, Protocol::definition(type).opcode, 1);
    Utils::appendLittleEndian(input, accessoryId >> 32, 2);          // authority id
    Utils::appendLittleEndian(input, accessoryId & 0xFFFFFFFFULL, 4); // device id
    return authDigits(controllerKey, input);
}

uint32_t ChannelOrigin::linkChallenge(uint64_t accessoryCount, const SecretKey& accessoryKey) {
    checkCount(accessoryCount, "Accessory command count");

    std::vector<uint8_t> input;
    Utils::appendLittleEndian(input, accessoryCount, 4);
    return authDigits(accessoryKey, input);
}

uint32_t ChannelOrigin::linkAuth(uint64_t controllerCount, uint8_t accessoryDigit,
                                 uint32_t challenge, const SecretKey& controllerKey) {
    checkCount(controllerCount, "Controller command count");

    std::vector<uint8_t> input;
    Utils::appendLittleEndian(input, controllerCount, 4);
    Utils::appendLittleEndian(input,
        Protocol::definition(MessageType::OriginLinkAccessoryMode3).opcode, 1);
    Utils::appendLittleEndian(input, accessoryDigit, 1);
    Utils::appendLittleEndian(input, challenge, 4);
    return authDigits(controllerKey, input);
}

Message ChannelOrigin::genericAction(GenericAction action, uint64_t controllerCount,
                                     const SecretKey& controllerKey) {
    return Message{MessageType::OriginGenericControllerAction,
                   {{"action", static_cast<uint64_t>(action)},
                    {"auth", genericActionAuth(controllerCount, action, controllerKey)}},
                   controllerCount, controllerKey};
}

Message ChannelOrigin::specificAccessory(MessageType type, uint64_t accessoryId,
                                         uint64_t controllerCount,
                                         const SecretKey& controllerKey) {
    return Message{type,
                   {{"accessory_digit", accessoryDigit(accessoryId)},
                    {"auth", specificAccessoryAuth(type, accessoryId, controllerCount,
                                                   controllerKey)}},
                   controllerCount, controllerKey};
}

Message ChannelOrigin::unlinkAllAccessories(uint64_t controllerCount,
                                            const SecretKey& controllerKey) {
    return genericAction(GenericAction::UnlinkAllAccessories, controllerCount, controllerKey);
}

Message ChannelOrigin::unlockAllAccessories(uint64_t controllerCount,
                                            const SecretKey& controllerKey) {
    return genericAction(GenericAction::UnlockAllAccessories, controllerCount, controllerKey);
}

Message ChannelOrigin::unlockAccessory(uint64_t accessoryId, uint64_t controllerCount,
                                       const SecretKey& controllerKey) {
    return specificAccessory(MessageType::OriginUnlockAccessory, accessoryId, controllerCount,
                             controllerKey);
}

Message ChannelOrigin::unlinkAccessory(uint64_t accessoryId, uint64_t controllerCount,
                                       const SecretKey& controllerKey) {
    return specificAccessory(MessageType::OriginUnlinkAccessory, accessoryId, controllerCount,
                             controllerKey);
}

Message ChannelOrigin::linkAccessoryMode3(uint64_t accessoryId, uint64_t controllerCount,
                                          uint64_t accessoryCount,
                                          const SecretKey& accessoryKey,
                                          const SecretKey& controllerKey) {
    const uint8_t digit = accessoryDigit(accessoryId);
    const uint32_t challenge = linkChallenge(accessoryCount, accessoryKey);
    return Message{MessageType::OriginLinkAccessoryMode3,
                   {{"accessory_digit", digit},
                    {"challenge", challenge},
                    {"auth", linkAuth(controllerCount, digit, challenge, controllerKey)}},
                   controllerCount, controllerKey};
}

} // namespace nexus_keycode
