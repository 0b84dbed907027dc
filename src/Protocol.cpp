#include "Protocol.hpp"
#include <stdexcept>

namespace nexus_keycode {

namespace {
    constexpr uint64_t SIX_DIGIT_MAX = 999999;

    // Small set-credit increments; 240-253 belong to custom commands
    const std::vector<ValueRange> SET_CREDIT_INCREMENTS = {{0, 239}, {254, 255}};

    std::vector<MessageDefinition> buildRegistry() {
        // Order must match the MessageType enumeration
        return {
            // Full family: opcode(4) | id(6) | fields | digest(20)
            {MessageType::FullAddCredit, Family::Full, "full.add_credit",
             0, 0, 4, 6, false, 20, true, 15, std::nullopt,
             {{"hours", 17, {{0, ProtocolParameters::FULL_UNLOCK_HOURS}}}}},
            {MessageType::FullSetCredit, Family::Full, "full.set_credit",
             1, 1, 4, 6, false, 20, true, 15, std::nullopt,
             {{"hours", 17, {{0, ProtocolParameters::FULL_UNLOCK_HOURS}}}}},
            {MessageType::FullWipeState, Family::Full, "full.wipe_state",
             2, 2, 4, 6, false, 20, true, 10, std::nullopt,
             {{"flags", 2, {{0, 2}}}}},
            {MessageType::FullFactoryAllowTest, Family::Full, "full.factory_allow_test",
             4, 4, 4, 0, true, 20, false, 8, uint8_t{0x00}, {}},
            {MessageType::FullFactoryOqcTest, Family::Full, "full.factory_oqc_test",
             5, 5, 4, 0, true, 20, false, 8, uint8_t{0x00}, {}},
            {MessageType::FullFactoryDisplayPaygId, Family::Full, "full.factory_display_payg_id",
             6, 6, 4, 0, true, 20, false, 8, uint8_t{0x00}, {}},
            {MessageType::FullPassthroughCommand, Family::Full, "full.passthrough_command",
             8, 8, 4, 6, false, 20, true, 24, std::nullopt,
             {{"payload", 48, {}}}},

            // Small family: opcode(2) | id(6) | body(8) | digest(12)
            {MessageType::SmallAddCredit, Family::Small, "small.add_credit",
             0, 0, 2, 6, false, 12, true, 13, std::nullopt,
             {{"increment", 8, {}}}},
            {MessageType::SmallSetCredit, Family::Small, "small.set_credit",
             2, 2, 2, 6, false, 12, true, 13, std::nullopt,
             {{"increment", 8, SET_CREDIT_INCREMENTS}}},
            {MessageType::SmallCustomCommand, Family::Small, "small.custom_command",
             2, 2, 2, 6, false, 12, true, 13, std::nullopt,
             {{"command", 8, {{240, 253}}}}},
            {MessageType::SmallMaintenance, Family::Small, "small.maintenance",
             3, 3, 2, 6, true, 12, true, 13, std::nullopt,
             {{"function", 8, {{128, 130}}}}},
            {MessageType::SmallTest, Family::Small, "small.test",
             3, 3, 2, 6, true, 12, true, 13, uint8_t{0xFF},
             {{"function", 8, {{0, 1}}}}},
            // The payload carries its own identifier bits and digest
            {MessageType::SmallPassthrough, Family::Small, "small.passthrough",
             1, 1, 2, 0, false, 0, true, 13, std::nullopt,
             {{"payload", 26, {}}}},

            // Small-extended: app id(1) | id(5) | increment(8) | digest(12).
            // The subtype (opcode) is only bound into the digest.
            {MessageType::ExtendedSetCreditWipeRestrictedFlag, Family::SmallExtended,
             "extended.set_credit_wipe_restricted_flag",
             0, 1, 1, 5, false, 12, false, 0, std::nullopt,
             {{"increment", 8, SET_CREDIT_INCREMENTS}}},

            // Channel-origin commands: type(4) | fields, carried unauthenticated
            {MessageType::OriginGenericControllerAction, Family::ChannelOrigin,
             "origin.generic_controller_action",
             0, 0, 4, 0, false, 0, false, 0, std::nullopt,
             {{"action", 7, {{0, 99}}}, {"auth", 20, {{0, SIX_DIGIT_MAX}}}}},
            {MessageType::OriginUnlockAccessory, Family::ChannelOrigin,
             "origin.unlock_accessory",
             1, 1, 4, 0, false, 0, false, 0, std::nullopt,
             {{"accessory_digit", 4, {{0, 9}}}, {"auth", 20, {{0, SIX_DIGIT_MAX}}}}},
            {MessageType::OriginUnlinkAccessory, Family::ChannelOrigin,
             "origin.unlink_accessory",
             2, 2, 4, 0, false, 0, false, 0, std::nullopt,
             {{"accessory_digit", 4, {{0, 9}}}, {"auth", 20, {{0, SIX_DIGIT_MAX}}}}},
            {MessageType::OriginLinkAccessoryMode3, Family::ChannelOrigin,
             "origin.link_accessory_mode_3",
             9, 9, 4, 0, false, 0, false, 0, std::nullopt,
             {{"accessory_digit", 4, {{0, 9}}},
              {"challenge", 20, {{0, SIX_DIGIT_MAX}}},
              {"auth", 20, {{0, SIX_DIGIT_MAX}}}}},
        };
    }

    const std::vector<MessageDefinition>& registry() {
        static const std::vector<MessageDefinition> table = buildRegistry();
        return table;
    }
}

uint64_t FieldSpec::maxValue() const {
    return width >= 64 ? UINT64_MAX : (uint64_t{1} << width) - 1;
}

bool FieldSpec::accepts(uint64_t value) const {
    if (value > maxValue()) {
        return false;
    }
    if (domain.empty()) {
        return true;
    }
    for (const auto& range : domain) {
        if (range.contains(value)) {
            return true;
        }
    }
    return false;
}

size_t MessageDefinition::bodyBits() const {
    size_t bits = 0;
    for (const auto& spec : fields) {
        bits += spec.width;
    }
    return bits;
}

const FieldSpec* MessageDefinition::field(const std::string& fieldName) const {
    for (const auto& spec : fields) {
        if (spec.name == fieldName) {
            return &spec;
        }
    }
    return nullptr;
}

const MessageDefinition& Protocol::definition(MessageType type) {
    const auto& table = registry();
    const auto& entry = table.at(static_cast<size_t>(type));
    if (entry.type != type) {
        throw std::logic_error("Protocol registry out of order");
    }
    return entry;
}

const FamilyTraits& Protocol::traits(Family family) {
    static const std::vector<FamilyTraits> families = {
        {Family::Full, 10, '0', 5, true, 3, 20, false, MessageType::FullPassthroughCommand},
        {Family::Small, 5, '1', 7, false, 0, 12, false, MessageType::SmallPassthrough},
        {Family::SmallExtended, 0, '1', 0, false, 0, 0, true, MessageType::SmallPassthrough},
        {Family::ChannelOrigin, 0, '0', 0, false, 0, 0, true, MessageType::FullPassthroughCommand},
    };
    return families.at(static_cast<size_t>(family));
}

const std::vector<MessageType>& Protocol::messageTypes() {
    static const std::vector<MessageType> types = [] {
        std::vector<MessageType> all;
        for (const auto& entry : registry()) {
            all.push_back(entry.type);
        }
        return all;
    }();
    return types;
}

std::vector<MessageType> Protocol::messageTypes(Family family) {
    std::vector<MessageType> types;
    for (const auto& entry : registry()) {
        if (entry.family == family) {
            types.push_back(entry.type);
        }
    }
    return types;
}

const std::vector<uint8_t>& Protocol::reservedDiscriminators(Family family) {
    static const std::vector<uint8_t> none;
    static const std::vector<uint8_t> extendedSubtypes = {0, 1, 2, 3, 4, 5, 6, 7};
    return family == Family::SmallExtended ? extendedSubtypes : none;
}

const std::vector<ReservedPattern>& Protocol::reservedPatterns() {
    static const std::vector<ReservedPattern> patterns = {
        {MessageType::SmallSetCredit, 0x3F, 0x3F, "increment", 0,
         "reads as a legacy factory test code"},
    };
    return patterns;
}

std::optional<MessageType> Protocol::find(const std::string& name) {
    for (const auto& entry : registry()) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

} // namespace nexus_keycode
