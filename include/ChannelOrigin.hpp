#pragma once

#include "Encoder.hpp"

namespace nexus_keycode {

// Accessory-link management commands issued by the origin (backend) to a
// controller. Each command carries its own six-digit authentication fields
// and is sent inside a Full passthrough keycode whose id is the controller
// command count.
class ChannelOrigin {
public:
    static constexpr uint64_t MAX_ACCESSORY_ID = 0xFFFFFFFFFFFFULL; // 48 bits
    static constexpr uint32_t AUTH_MODULUS = 1000000;

    enum class GenericAction : uint8_t {
        UnlinkAllAccessories = 0,
        UnlockAllAccessories = 1
    };

    static Message unlinkAllAccessories(uint64_t controllerCount, const SecretKey& controllerKey);
    static Message unlockAllAccessories(uint64_t controllerCount, const SecretKey& controllerKey);
    static Message unlockAccessory(uint64_t accessoryId, uint64_t controllerCount,
                                   const SecretKey& controllerKey);
    static Message unlinkAccessory(uint64_t accessoryId, uint64_t controllerCount,
                                   const SecretKey& controllerKey);
    static Message linkAccessoryMode3(uint64_t accessoryId, uint64_t controllerCount,
                                      uint64_t accessoryCount, const SecretKey& accessoryKey,
                                      const SecretKey& controllerKey);

    // Six decimal digits from the low 32 bits of SipHash-2-4
    static uint32_t authDigits(const SecretKey& key, const std::vector<uint8_t>& input);

    static uint32_t genericActionAuth(uint64_t controllerCount, GenericAction action,
                                      const SecretKey& controllerKey);
    static uint32_t specificAccessoryAuth(MessageType type, uint64_t accessoryId,
                                          uint64_t controllerCount,
                                          const SecretKey& controllerKey);
    // Challenge result the accessory validates
    static uint32_t linkChallenge(uint64_t accessoryCount, const SecretKey& accessoryKey);
    static uint32_t linkAuth(uint64_t controllerCount, uint8_t accessoryDigit,
                             uint32_t challenge, const SecretKey& controllerKey);

    // Last decimal digit of the 32-bit device part of the accessory id
    static uint8_t accessoryDigit(uint64_t accessoryId);

private:
    static Message genericAction(GenericAction action, uint64_t controllerCount,
                                 const SecretKey& controllerKey);
    static Message specificAccessory(MessageType type, uint64_t accessoryId,
                                     uint64_t controllerCount, const SecretKey& controllerKey);

    ChannelOrigin() = delete;
};

} // namespace nexus_keycode
