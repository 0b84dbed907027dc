#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "KeycodeTypes.hpp"

namespace nexus_keycode {

// Per-device symmetric key. Only the first 16 bytes are used; the copy held
// here is wiped on destruction.
class SecretKey {
public:
    explicit SecretKey(const std::vector<uint8_t>& bytes);
    ~SecretKey();

    SecretKey(const SecretKey&) = default;
    SecretKey& operator=(const SecretKey&) = default;

    // 16 copies of one byte, e.g. the fixed keys of factory messages
    static SecretKey filled(uint8_t value);
    // 32 hexadecimal characters
    static SecretKey fromHex(std::string_view hex);

    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

class Crypto {
public:
    // SipHash-2-4 with 64-bit output, returned as the little-endian integer
    static uint64_t siphash24(const SecretKey& key, const std::vector<uint8_t>& data);

    // Deterministic pseudorandom bits expanded from a seed; used to obscure
    // the structure of a keycode
    static BitString pseudorandomBits(const BitString& seed, size_t length);

    // Secure memory wiping
    static void secureWipe(std::vector<uint8_t>& data);

    // Throws std::runtime_error carrying the OpenSSL error queue
    [[noreturn]] static void handleOpenSSLError(const std::string& operation);

private:
    static constexpr size_t SIPHASH_OUTPUT_SIZE = 8;
    static constexpr size_t MAX_PSEUDORANDOM_CHUNKS = 256; // one counter byte

    // Prevent instantiation
    Crypto() = delete;
    ~Crypto() = delete;
    Crypto(const Crypto&) = delete;
    Crypto& operator=(const Crypto&) = delete;
};

} // namespace nexus_keycode
