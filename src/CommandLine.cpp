#include "CommandLine.hpp"
#include "ChannelOrigin.hpp"
#include "Messages.hpp"
#include "Utils.hpp"
#include <set>
#include <stdexcept>

namespace nexus_keycode {

namespace {
    // Options that take no value
    const std::set<std::string> FLAGS = {"quiet", "unlock"};

    // Options that take a value
    const std::set<std::string> VALUE_OPTIONS = {
        "type", "id", "key", "hours", "flags", "days", "function", "payload",
        "accessory-id", "accessory-count", "accessory-key",
        "log-level", "log-file", "max-attempts"
    };

    const std::set<std::string> FULL_TYPES = {
        "ADD", "SET", "UNLOCK", "WIPE", "ALLOW_TEST", "OQC_TEST", "DISPLAY_ID",
        "UNLINK_ALL", "UNLOCK_ALL", "UNLINK", "UNLOCK_ACCESSORY", "LINK"
    };
    const std::set<std::string> SMALL_TYPES = {
        "ADD", "SET", "UNLOCK", "LOCK", "WIPE", "TEST", "WIPE_RESTRICTED", "EXTENDED",
        "PASSTHROUGH"
    };

    constexpr uint64_t MAX_HOURS = ProtocolParameters::FULL_UNLOCK_HOURS;
    constexpr uint64_t MAX_DAYS = 0xFFFF;
    constexpr uint64_t SMALL_PASSTHROUGH_MAX = (uint64_t{1} << 26) - 1;

    Message buildFullMessage(const CommandLine& args) {
        const std::string& type = args.type();
        if (!FULL_TYPES.count(type)) {
            throw std::invalid_argument("Unknown full message type: " + type);
        }

        if (type == "ALLOW_TEST") return FullMessages::factoryAllowTest();
        if (type == "OQC_TEST") return FullMessages::factoryOqcTest();
        if (type == "DISPLAY_ID") return FullMessages::factoryDisplayPaygId();

        const uint64_t id = args.number("id", ProtocolParameters::MAX_MESSAGE_ID);
        const SecretKey key = args.key("key");

        if (type == "ADD") {
            return FullMessages::addCredit(id, static_cast<uint32_t>(args.number("hours", MAX_HOURS)), key);
        }
        if (type == "SET") {
            return FullMessages::setCredit(id, static_cast<uint32_t>(args.number("hours", MAX_HOURS)), key);
        }
        if (type == "UNLOCK") return FullMessages::unlock(id, key);
        if (type == "WIPE") {
            return FullMessages::wipeState(id, static_cast<FullWipeFlags>(args.number("flags", 2)), key);
        }
        if (type == "UNLINK_ALL") return ChannelOrigin::unlinkAllAccessories(id, key);
        if (type == "UNLOCK_ALL") return ChannelOrigin::unlockAllAccessories(id, key);

        const uint64_t accessoryId = args.number("accessory-id", ChannelOrigin::MAX_ACCESSORY_ID);
        if (type == "UNLINK") return ChannelOrigin::unlinkAccessory(accessoryId, id, key);
        if (type == "LINK") {
            return ChannelOrigin::linkAccessoryMode3(accessoryId, id,
                args.number("accessory-count", ProtocolParameters::MAX_MESSAGE_ID),
                args.key("accessory-key"), key);
        }
        return ChannelOrigin::unlockAccessory(accessoryId, id, key);
    }

    Message buildSmallMessage(const CommandLine& args) {
        const std::string& type = args.type();
        if (!SMALL_TYPES.count(type)) {
            throw std::invalid_argument("Unknown small message type: " + type);
        }

        if (type == "TEST") {
            return SmallMessages::test(static_cast<TestFunction>(args.number("function", 1)));
        }
        if (type == "PASSTHROUGH") {
            return SmallMessages::passthrough(args.number("payload", SMALL_PASSTHROUGH_MAX));
        }

        const SecretKey key = args.key("key");
        if (type == "WIPE") {
            return SmallMessages::maintenance(
                static_cast<MaintenanceFunction>(args.number("function", 2)), key);
        }

        const uint64_t id = args.number("id", ProtocolParameters::MAX_MESSAGE_ID);
        if (type == "ADD") {
            return SmallMessages::addCredit(id, static_cast<uint32_t>(args.number("days", MAX_DAYS)), key);
        }
        if (type == "SET") {
            return SmallMessages::setCredit(id, static_cast<uint32_t>(args.number("days", MAX_DAYS)), key);
        }
        if (type == "UNLOCK") return SmallMessages::unlock(id, key);
        if (type == "LOCK") return SmallMessages::lock(id, key);
        if (type == "WIPE_RESTRICTED") {
            return SmallMessages::customCommand(id, CustomCommand::WipeRestrictedFlag, key);
        }
        if (args.has("unlock")) {
            return SmallMessages::extendedUnlockWipeRestrictedFlag(id, key);
        }
        return SmallMessages::extendedSetCreditWipeRestrictedFlag(
            id, static_cast<uint32_t>(args.number("days", MAX_DAYS)), key);
    }
}

void GeneratorConfig::apply() const {
    Logger::setLogLevel(logLevel);
    Logger::enableConsoleOutput(consoleOutput);
    if (!logFile.empty()) {
        Logger::setLogFile(logFile);
    }
}

CommandLine CommandLine::parse(int argc, const char* const argv[]) {
    if (argc < 2) {
        throw std::invalid_argument("Missing protocol family");
    }

    CommandLine args;
    args.family_ = argv[1];
    if (args.family_ != "full" && args.family_ != "small") {
        throw std::invalid_argument("Protocol family must be 'full' or 'small'");
    }

    for (int i = 2; i < argc; ++i) {
        const std::string token = argv[i];
        if (token.size() < 3 || token.compare(0, 2, "--") != 0) {
            throw std::invalid_argument("Unexpected argument: " + token);
        }

        const std::string name = token.substr(2);
        if (FLAGS.count(name)) {
            args.options_[name] = "";
            continue;
        }
        if (!VALUE_OPTIONS.count(name)) {
            throw std::invalid_argument("Unknown option: " + token);
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + token);
        }
        args.options_[name] = argv[++i];
    }

    args.type_ = args.option("type");
    args.options_.erase("type");

    if (args.has("log-level")) {
        auto level = Logger::parseLevel(args.option("log-level"));
        if (!level) {
            throw std::invalid_argument("Unknown log level: " + args.option("log-level"));
        }
        args.config_.logLevel = *level;
    }
    if (args.has("log-file")) {
        args.config_.logFile = args.option("log-file");
    }
    if (args.has("quiet")) {
        args.config_.consoleOutput = false;
    }
    if (args.has("max-attempts")) {
        args.config_.retry.maxAttempts = static_cast<unsigned>(args.number("max-attempts", 1000));
        if (args.config_.retry.maxAttempts == 0) {
            throw std::invalid_argument("--max-attempts must be at least 1");
        }
    }
    return args;
}

std::string CommandLine::usage(const std::string& program) {
    return "Usage: " + program + " full --type TYPE [options]\n"
           "       " + program + " small --type TYPE [options]\n"
           "\n"
           "Full types:  ADD --hours N, SET --hours N, UNLOCK, WIPE --flags 0|1|2,\n"
           "             ALLOW_TEST, OQC_TEST, DISPLAY_ID, UNLINK_ALL, UNLOCK_ALL,\n"
           "             UNLINK --accessory-id ID, UNLOCK_ACCESSORY --accessory-id ID,\n"
           "             LINK --accessory-id ID --accessory-count N --accessory-key HEX\n"
           "Small types: ADD --days N, SET --days N, UNLOCK, LOCK, WIPE --function 0|1|2,\n"
           "             TEST --function 0|1, WIPE_RESTRICTED, EXTENDED --days N|--unlock,\n"
           "             PASSTHROUGH --payload N\n"
           "\n"
           "Common options: --id N, --key HEX (32 hex characters), --max-attempts N,\n"
           "                --log-level LEVEL, --log-file PATH, --quiet\n";
}

bool CommandLine::has(const std::string& name) const {
    return options_.count(name) != 0;
}

const std::string& CommandLine::option(const std::string& name) const {
    auto it = options_.find(name);
    if (it == options_.end()) {
        throw std::invalid_argument("Missing option --" + name);
    }
    return it->second;
}

uint64_t CommandLine::number(const std::string& name, uint64_t maxValue) const {
    try {
        return Utils::parseUnsigned(option(name), maxValue);
    }
    catch (const std::out_of_range& e) {
        throw std::invalid_argument("--" + name + ": " + e.what());
    }
}

SecretKey CommandLine::key(const std::string& name) const {
    return SecretKey::fromHex(option(name));
}

Message buildMessage(const CommandLine& args) {
    return args.family() == "full" ? buildFullMessage(args) : buildSmallMessage(args);
}

} // namespace nexus_keycode
