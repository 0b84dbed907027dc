#include "Crypto.hpp"      // Include the header for Crypto declarations
#include "Logger.hpp"      // For logging key and OpenSSL failures
#include "Utils.hpp"       // For hex decoding
#include <stdexcept>       // For std::runtime_error, etc.
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace nexus_keycode { // Begin namespace nexus_keycode

namespace {
    class ScopedEVP_MAC {
    public:
        ScopedEVP_MAC() : mac_(EVP_MAC_fetch(nullptr, "SIPHASH", nullptr)) {
            if (!mac_) Crypto::handleOpenSSLError("EVP_MAC_fetch");
        }
        ~ScopedEVP_MAC() { EVP_MAC_free(mac_); }
        EVP_MAC* get() { return mac_; }
    private:
        EVP_MAC* mac_;
    };

    class ScopedEVP_MAC_CTX {
    public:
        explicit ScopedEVP_MAC_CTX(EVP_MAC* mac) : ctx_(EVP_MAC_CTX_new(mac)) {
            if (!ctx_) Crypto::handleOpenSSLError("EVP_MAC_CTX_new");
        }
        ~ScopedEVP_MAC_CTX() { EVP_MAC_CTX_free(ctx_); }
        EVP_MAC_CTX* get() { return ctx_; }
    private:
        EVP_MAC_CTX* ctx_;
    };
}

SecretKey::SecretKey(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < ProtocolParameters::SECRET_KEY_SIZE) {
        Logger::logError(ErrorCode::InvalidKey,
            "Secret key has " + std::to_string(bytes.size()) + " bytes");
        throw std::invalid_argument("Invalid key size");
    }
    bytes_.assign(bytes.begin(), bytes.begin() + ProtocolParameters::SECRET_KEY_SIZE);
}

SecretKey::~SecretKey() {
    Crypto::secureWipe(bytes_);
}

SecretKey SecretKey::filled(uint8_t value) {
    return SecretKey(std::vector<uint8_t>(ProtocolParameters::SECRET_KEY_SIZE, value));
}

SecretKey SecretKey::fromHex(std::string_view hex) {
    if (hex.size() != ProtocolParameters::SECRET_KEY_SIZE * 2) {
        Logger::logError(ErrorCode::InvalidKey,
            "Secret key has " + std::to_string(hex.size()) + " hexadecimal characters");
        throw std::invalid_argument("Secret key must be 32 hexadecimal characters");
    }
    std::vector<uint8_t> bytes;
    try {
        bytes = Utils::parseHex(hex);
    }
    catch (const std::invalid_argument& e) {
        Logger::logError(ErrorCode::InvalidKey, e.what());
        throw;
    }
    SecretKey key(bytes);
    Crypto::secureWipe(bytes);
    return key;
}

uint64_t Crypto::siphash24(const SecretKey& key, const std::vector<uint8_t>& data) {
    ScopedEVP_MAC mac;
    ScopedEVP_MAC_CTX ctx(mac.get());

    // OpenSSL defaults to the 128-bit variant
    size_t outputSize = SIPHASH_OUTPUT_SIZE;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &outputSize),
        OSSL_PARAM_construct_end()
    };

    if (!EVP_MAC_init(ctx.get(), key.bytes().data(), key.bytes().size(), params)) {
        Crypto::handleOpenSSLError("EVP_MAC_init");
    }

    if (!data.empty() && !EVP_MAC_update(ctx.get(), data.data(), data.size())) {
        Crypto::handleOpenSSLError("EVP_MAC_update");
    }

    unsigned char out[SIPHASH_OUTPUT_SIZE];
    size_t outLen = 0;
    if (!EVP_MAC_final(ctx.get(), out, &outLen, sizeof(out))) {
        Crypto::handleOpenSSLError("EVP_MAC_final");
    }
    if (outLen != SIPHASH_OUTPUT_SIZE) {
        throw std::runtime_error("Unexpected SipHash output size");
    }

    uint64_t result = 0;
    for (size_t i = SIPHASH_OUTPUT_SIZE; i > 0; --i) {
        result = (result << 8) | out[i - 1];
    }
    OPENSSL_cleanse(out, sizeof(out));
    return result;
}

BitString Crypto::pseudorandomBits(const BitString& seed, size_t length) {
    const size_t chunks = (length + 63) / 64;
    if (chunks > MAX_PSEUDORANDOM_CHUNKS) {
        throw std::invalid_argument("Too many pseudorandom bits requested");
    }

    const SecretKey fixedKey = SecretKey::filled(0x00);
    const std::vector<uint8_t> seedBytes = seed.toBytes();

    BitString output;
    for (size_t i = 0; i < chunks; ++i) {
        std::vector<uint8_t> input;
        input.reserve(seedBytes.size() + 1);
        input.push_back(static_cast<uint8_t>(i));
        input.insert(input.end(), seedBytes.begin(), seedBytes.end());

        // Serialized little-endian, each byte MSB first
        uint64_t hash = siphash24(fixedKey, input);
        for (size_t b = 0; b < SIPHASH_OUTPUT_SIZE; ++b) {
            output.append(hash & 0xFF, 8);
            hash >>= 8;
        }
    }

    return output.slice(0, length);
}

void Crypto::handleOpenSSLError(const std::string& operation) {
    std::string error;
    while (unsigned long err = ERR_get_error()) {
        char err_buf[256];
        ERR_error_string_n(err, err_buf, sizeof(err_buf));
        if (!error.empty()) error += "; ";
        error += err_buf;
    }
    Logger::logError(ErrorCode::CryptoFailure, operation + " failed: " + error);
    throw std::runtime_error(operation + " failed: " + error);
}

void Crypto::secureWipe(std::vector<uint8_t>& data) {
    if (data.empty()) return;

    // Use OpenSSL's secure memory wiping function
    OPENSSL_cleanse(data.data(), data.size());
    data.clear();
    data.shrink_to_fit(); // Release the memory back to the system
}

} // namespace nexus_keycode
