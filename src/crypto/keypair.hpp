#ifndef PINSEAL_CRYPTO_KEYPAIR_HPP
#define PINSEAL_CRYPTO_KEYPAIR_HPP

#include "../helpers.hpp"
#include <string>

namespace pinseal {

// Key sizes for X25519
constexpr size_t PRIVATE_KEY_SIZE = 32;
constexpr size_t PUBLIC_KEY_SIZE = 32;

// -----------------------------------------------------------------------------
// KeyPair - X25519 key pair derived from a PIN
// -----------------------------------------------------------------------------
// private_key is a clamped Curve25519 scalar and public_key is its basepoint
// multiple. The private half must never be logged.
struct KeyPair {
    Bytes private_key;  // 32 bytes
    Bytes public_key;   // 32 bytes

    // Rebuild a key pair persisted as standard base64 halves.
    // Throws DecodingError on bad base64, std::invalid_argument on bad sizes.
    static KeyPair from_base64(const std::string& private_b64, const std::string& public_b64);

    std::string public_key_b64() const;

    // Short public key fingerprint for log lines
    std::string fingerprint() const;

    // Zero both halves in place
    void wipe();
};

bool operator==(const KeyPair& a, const KeyPair& b);
bool operator!=(const KeyPair& a, const KeyPair& b);

} // namespace pinseal

#endif // PINSEAL_CRYPTO_KEYPAIR_HPP
