#ifndef PINSEAL_CRYPTO_SEALEDBOX_HPP
#define PINSEAL_CRYPTO_SEALEDBOX_HPP

#include "keypair.hpp"

namespace pinseal {
namespace sealedbox {

constexpr size_t TAG_SIZE = 16;
constexpr size_t SEAL_OVERHEAD = PUBLIC_KEY_SIZE + TAG_SIZE;  // crypto_box_SEALBYTES

// Encrypt plaintext for a recipient's public key (anonymous encryption)
// Uses crypto_box_seal: ephemeral X25519 key + XSalsa20-Poly1305, nonce
// derived from BLAKE2b(ephemeral_pk || recipient_pk)
// Output: ephemeral_pk || ciphertext || tag (plaintext.size() + 48 bytes)
Bytes encrypt(const Bytes& recipient_public_key, const Bytes& plaintext);

// Decrypt ciphertext using the recipient's key pair
// Throws DecryptionFailure if the ciphertext is shorter than SEAL_OVERHEAD,
// the tag does not verify, or the ephemeral key is unusable
Bytes decrypt(const KeyPair& recipient, const Bytes& ciphertext);

} // namespace sealedbox
} // namespace pinseal

#endif // PINSEAL_CRYPTO_SEALEDBOX_HPP
