#include "Encoder.hpp"
#include "Authenticator.hpp"
#include "Errors.hpp"
#include "FieldEncoder.hpp"
#include "KeycodeFormatter.hpp"
#include "Logger.hpp"
#include "Passthrough.hpp"
#include "Protocol.hpp"

namespace nexus_keycode {

AuthenticatedPayload Encoder::authenticate(const Message& message) {
    const Body body = FieldEncoder::encodeBody(message.type, message.fields);
    return Authenticator::authenticate(message.id, body, message.key);
}

Keycode Encoder::encode(const Message& message) {
    const MessageDefinition& def = Protocol::definition(message.type);
    try {
        AuthenticatedPayload payload = authenticate(message);

        if (Protocol::traits(def.family).carried) {
            const Body hostBody = PassthroughEncoder::embed(payload);
            const uint64_t hostId = Protocol::definition(hostBody.type).fixedId ? 0 : message.id;
            payload = Authenticator::authenticate(hostId, hostBody, message.key);
        }

        Keycode keycode = KeycodeFormatter::format(payload);
        Logger::logEvent(LogLevel::Debug, std::string("Encoded ") + def.name + " id " +
            std::to_string(message.id) + ": " + keycode.text);
        return keycode;
    }
    catch (const IdCollisionError& e) {
        Logger::logEvent(LogLevel::Warning, e.what());
        throw;
    }
    catch (const KeycodeError& e) {
        Logger::logError(e.code(), std::string(def.name) + ": " + e.what());
        throw;
    }
}

EncodeResult Encoder::encodeWithRetry(const Message& message, const RetryPolicy& policy) {
    if (policy.maxAttempts == 0) {
        throw std::invalid_argument("Retry policy needs at least one attempt");
    }

    Message attempt = message;
    for (unsigned attempts = 1;; ++attempts) {
        try {
            Keycode keycode = encode(attempt);
            return EncodeResult{keycode, attempt.id, attempts};
        }
        catch (const IdCollisionError& e) {
            if (attempts >= policy.maxAttempts || e.nextId() > ProtocolParameters::MAX_MESSAGE_ID) {
                Logger::logError(ErrorCode::IdCollision, "Giving up after " +
                    std::to_string(attempts) + " attempt(s), last id " + std::to_string(e.id()));
                throw;
            }
            attempt.id = e.nextId();
        }
    }
}

} // namespace nexus_keycode
