#ifndef PINSEAL_CRYPTO_FIELD_HPP
#define PINSEAL_CRYPTO_FIELD_HPP

#include "keypair.hpp"
#include <string>

namespace pinseal {
namespace field {

// Prefix carried by every end-to-end encrypted field value
constexpr const char* ENCRYPTED_PREFIX = "e2e::";

// True iff value starts with ENCRYPTED_PREFIX
bool is_encrypted(const std::string& value);

// Decrypt an "e2e::<base64>" value. Values without the prefix are returned
// unchanged. Throws DecodingError or DecryptionFailure.
std::string decrypt_field(const std::string& value, const KeyPair& kp);

// Seal plaintext for a base64 public key and return "e2e::<base64>".
// An empty plaintext stays empty.
std::string encrypt_field(const std::string& plaintext, const std::string& public_key_b64);

// Like decrypt_field, but logs a warning and returns the original value when
// it cannot be decrypted
std::string try_decrypt_field(const std::string& value, const KeyPair& kp);

} // namespace field
} // namespace pinseal

#endif // PINSEAL_CRYPTO_FIELD_HPP
