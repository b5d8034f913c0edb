#ifndef PINSEAL_CRYPTO_KDF_HPP
#define PINSEAL_CRYPTO_KDF_HPP

#include "keypair.hpp"
#include <cstdint>
#include <string>

namespace pinseal {
namespace kdf {

// Argon2id parameters. These must match libsodium's crypto_pwhash as used by
// the server; libsodium runs Argon2id with parallelism 1 internally.
constexpr unsigned long long OPS_LIMIT = 3;
constexpr size_t MEM_LIMIT = 64 * 1024 * 1024;  // 65536 KiB
constexpr size_t PARALLELISM = 1;
constexpr size_t SEED_SIZE = 32;
constexpr size_t SALT_SIZE = 16;  // crypto_pwhash_SALTBYTES

// Argon2id(pin, salt) -> 32-byte seed.
// Any pin and salt bytes are accepted, including empty strings. SALT_SIZE
// salts go through libsodium, other lengths through Botan's Argon2id.
// Throws DerivationError if hashing fails.
Bytes derive_seed(const std::string& pin, const Bytes& salt);

// Same pipeline as crypto_box_seed_keypair, with the stored scalar clamped:
//   SHA-512(seed)[0..32) -> clamp -> scalarmult_base
KeyPair keypair_from_seed(const Bytes& seed);

// Deterministic key pair for (pin, salt): derive_seed then keypair_from_seed.
KeyPair derive_keypair(const std::string& pin, const Bytes& salt);

// True if the scalar carries the X25519 clamping bit pattern
bool is_clamped(const Bytes& private_key);

} // namespace kdf
} // namespace pinseal

#endif // PINSEAL_CRYPTO_KDF_HPP
