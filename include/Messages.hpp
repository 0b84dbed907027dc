#pragma once

#include "Encoder.hpp"

namespace nexus_keycode {

// Full family wipe targets
enum class FullWipeFlags : uint8_t {
    TargetFlags0 = 0, // Wipe state, except for received-ids bitmask
    TargetFlags1 = 1, // Wipe state, including received-ids bitmask
    WipeIdsAll = 2    // Clear received-ids bitmask only
};

class FullMessages {
public:
    static Message addCredit(uint64_t id, uint32_t hours, const SecretKey& key);
    static Message setCredit(uint64_t id, uint32_t hours, const SecretKey& key);
    static Message unlock(uint64_t id, const SecretKey& key);
    static Message wipeState(uint64_t id, FullWipeFlags flags, const SecretKey& key);

    // Factory messages carry no identifier and use an all-zero key
    static Message factoryAllowTest();
    static Message factoryOqcTest();
    static Message factoryDisplayPaygId();

    // Raw 48-bit passthrough payload
    static Message passthrough(uint64_t id, uint64_t payload, const SecretKey& key);

private:
    FullMessages() = delete;
};

enum class MaintenanceFunction : uint8_t {
    WipeState0 = 0,
    WipeState1 = 1,
    WipeIdsAll = 2
};

enum class TestFunction : uint8_t {
    ShortTest = 0,
    OqcTest = 1
};

enum class CustomCommand : uint8_t {
    WipeRestrictedFlag = 253
};

class SmallMessages {
public:
    static constexpr uint8_t UNLOCK_INCREMENT = 255;
    static constexpr uint8_t LOCK_INCREMENT = 254;
    static constexpr uint32_t MAX_ADD_CREDIT_DAYS = 405;
    static constexpr uint32_t MAX_SET_CREDIT_DAYS = 960;

    // Day counts to the coarse increments the device understands.
    // Throw FieldRangeError for unsupported day counts.
    static uint8_t addCreditIncrement(uint32_t days);
    static uint8_t setCreditIncrement(uint32_t days);

    static Message addCredit(uint64_t id, uint32_t days, const SecretKey& key);
    static Message unlock(uint64_t id, const SecretKey& key);
    // 0 days locks the device
    static Message setCredit(uint64_t id, uint32_t days, const SecretKey& key);
    static Message lock(uint64_t id, const SecretKey& key);
    static Message customCommand(uint64_t id, CustomCommand command, const SecretKey& key);

    static Message maintenance(MaintenanceFunction function, const SecretKey& key);
    static Message test(TestFunction function);

    // Set credit and wipe the restricted flag in one code, carried by the
    // passthrough message
    static Message extendedSetCreditWipeRestrictedFlag(uint64_t id, uint32_t days,
                                                       const SecretKey& key);
    static Message extendedUnlockWipeRestrictedFlag(uint64_t id, const SecretKey& key);

    // Raw 26-bit passthrough payload
    static Message passthrough(uint64_t payload);

private:
    SmallMessages() = delete;
};

} // namespace nexus_keycode
