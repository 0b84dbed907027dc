#include "CommandLine.hpp"
#include "Encoder.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    using namespace nexus_keycode;

    const std::string program = argc > 0 ? argv[0] : "nexus_keycode";

    CommandLine args;
    try {
        args = CommandLine::parse(argc, argv);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << CommandLine::usage(program);
        return 2;
    }

    try {
        args.config().apply();
        Logger::logEvent(LogLevel::Info, "Generating " + args.family() + " " + args.type() +
            " keycode (protocol version " + std::to_string(PROTOCOL_VERSION) + ")");

        const Message message = buildMessage(args);
        const EncodeResult result = Encoder::encodeWithRetry(message, args.config().retry);

        std::cout << result.keycode.text << "\n";
        std::cout << "id: " << result.id << "\n";
        if (result.id != message.id) {
            std::cout << "note: id " << message.id << " was unusable, advanced to " << result.id
                      << "\n";
        }

        Logger::flush();
        return 0;
    }
    catch (const KeycodeError& e) {
        std::cerr << "error: " << e.what() << "\n";
        Logger::flush();
        return 1;
    }
    catch (const std::exception& e) {
        Logger::logError(ErrorCode::InvalidParameter, std::string("Fatal error: ") + e.what());
        std::cerr << "error: " << e.what() << "\n";
        Logger::flush();
        return 1;
    }
}
