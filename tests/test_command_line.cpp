#include <doctest/doctest.h>
#include "CommandLine.hpp"
#include "Protocol.hpp"

using namespace nexus_keycode;

namespace {
    const char* const KEY = "abababababababababababababababab";

    template <size_t N>
    CommandLine parse(const char* const (&argv)[N]) {
        return CommandLine::parse(static_cast<int>(N), argv);
    }
}

TEST_CASE("Full add credit options") {
    const char* const argv[] = {"nexus_keycode", "full", "--type", "ADD", "--id", "42",
                                "--hours", "168", "--key", KEY};
    const CommandLine args = parse(argv);
    CHECK(args.family() == "full");
    CHECK(args.type() == "ADD");

    const Message message = buildMessage(args);
    CHECK(message.type == MessageType::FullAddCredit);
    CHECK(message.id == 42);
    CHECK(message.fields.at("hours") == 168);
    CHECK(message.key.bytes() == SecretKey::filled(0xAB).bytes());
}

TEST_CASE("Numbers accept hexadecimal") {
    const char* const argv[] = {"nexus_keycode", "full", "--type", "UNLINK", "--id", "0x0f",
                                "--accessory-id", "0x010294837158", "--key", KEY};
    const Message message = buildMessage(parse(argv));
    CHECK(message.type == MessageType::OriginUnlinkAccessory);
    CHECK(message.id == 15);
    CHECK(message.fields.at("accessory_digit") == 0);
}

TEST_CASE("Numbers with leading zeros are decimal") {
    const char* const argv[] = {"nexus_keycode", "full", "--type", "ADD", "--id", "010",
                                "--hours", "0720", "--key", KEY};
    const Message message = buildMessage(parse(argv));
    CHECK(message.id == 10);
    CHECK(message.fields.at("hours") == 720);

    const char* const nine[] = {"nexus_keycode", "full", "--type", "UNLOCK", "--id", "09",
                                "--key", KEY};
    CHECK(buildMessage(parse(nine)).id == 9);

    const char* const upperHex[] = {"nexus_keycode", "full", "--type", "UNLOCK", "--id", "0X1F",
                                    "--key", KEY};
    CHECK(buildMessage(parse(upperHex)).id == 31);

    const char* const bareHex[] = {"nexus_keycode", "full", "--type", "UNLOCK", "--id", "1f",
                                   "--key", KEY};
    CHECK_THROWS_AS(buildMessage(parse(bareHex)), std::invalid_argument);

    const char* const emptyHex[] = {"nexus_keycode", "full", "--type", "UNLOCK", "--id", "0x",
                                    "--key", KEY};
    CHECK_THROWS_AS(buildMessage(parse(emptyHex)), std::invalid_argument);

    const char* const signedHex[] = {"nexus_keycode", "full", "--type", "UNLOCK", "--id", "0x-5",
                                     "--key", KEY};
    CHECK_THROWS_AS(buildMessage(parse(signedHex)), std::invalid_argument);
}

TEST_CASE("Small types map to their messages") {
    const char* const lock[] = {"nexus_keycode", "small", "--type", "LOCK", "--id", "3", "--key", KEY};
    CHECK(buildMessage(parse(lock)).type == MessageType::SmallSetCredit);

    const char* const extended[] = {"nexus_keycode", "small", "--type", "EXTENDED", "--id", "9",
                                    "--unlock", "--key", KEY};
    const Message message = buildMessage(parse(extended));
    CHECK(message.type == MessageType::ExtendedSetCreditWipeRestrictedFlag);
    CHECK(message.fields.at("increment") == 255);

    const char* const test[] = {"nexus_keycode", "small", "--type", "TEST", "--function", "0"};
    CHECK(buildMessage(parse(test)).type == MessageType::SmallTest);

    const char* const passthrough[] = {"nexus_keycode", "small", "--type", "PASSTHROUGH",
                                       "--payload", "123"};
    CHECK(buildMessage(parse(passthrough)).fields.at("payload") == 123);
}

TEST_CASE("Generator settings are read from the command line") {
    const char* const argv[] = {"nexus_keycode", "small", "--type", "UNLOCK", "--id", "1",
                                "--key", KEY, "--log-level", "debug", "--max-attempts", "3",
                                "--quiet", "--log-file", "keycodes.log"};
    const CommandLine args = parse(argv);
    const GeneratorConfig& config = args.config();
    CHECK(config.logLevel == LogLevel::Debug);
    CHECK(config.retry.maxAttempts == 3);
    CHECK_FALSE(config.consoleOutput);
    CHECK(config.logFile == "keycodes.log");
}

TEST_CASE("Malformed command lines are rejected") {
    const char* const noFamily[] = {"nexus_keycode"};
    CHECK_THROWS_AS(parse(noFamily), std::invalid_argument);

    const char* const badFamily[] = {"nexus_keycode", "medium", "--type", "ADD"};
    CHECK_THROWS_AS(parse(badFamily), std::invalid_argument);

    const char* const noType[] = {"nexus_keycode", "full", "--id", "1"};
    CHECK_THROWS_AS(parse(noType), std::invalid_argument);

    const char* const noValue[] = {"nexus_keycode", "full", "--type"};
    CHECK_THROWS_AS(parse(noValue), std::invalid_argument);

    const char* const misspelled[] = {"nexus_keycode", "small", "--type", "EXTENDED", "--id", "9",
                                      "--unlcok", "--key", KEY};
    CHECK_THROWS_AS(parse(misspelled), std::invalid_argument);

    const char* const unknownValue[] = {"nexus_keycode", "full", "--type", "ADD", "--hour", "5"};
    CHECK_THROWS_AS(parse(unknownValue), std::invalid_argument);

    const char* const badLevel[] = {"nexus_keycode", "full", "--type", "UNLOCK", "--log-level", "loud"};
    CHECK_THROWS_AS(parse(badLevel), std::invalid_argument);
}

TEST_CASE("Bad option values are rejected when building the message") {
    const char* const unknown[] = {"nexus_keycode", "full", "--type", "RESERVED", "--id", "1",
                                   "--key", KEY};
    CHECK_THROWS_AS(buildMessage(parse(unknown)), std::invalid_argument);

    const char* const shortKey[] = {"nexus_keycode", "full", "--type", "UNLOCK", "--id", "1",
                                    "--key", "abab"};
    CHECK_THROWS_AS(buildMessage(parse(shortKey)), std::invalid_argument);

    const char* const bigId[] = {"nexus_keycode", "full", "--type", "UNLOCK", "--id", "4294967296",
                                 "--key", KEY};
    CHECK_THROWS_AS(buildMessage(parse(bigId)), std::invalid_argument);

    const char* const badFlags[] = {"nexus_keycode", "full", "--type", "WIPE", "--id", "1",
                                    "--flags", "3", "--key", KEY};
    CHECK_THROWS_AS(buildMessage(parse(badFlags)), std::invalid_argument);
}
