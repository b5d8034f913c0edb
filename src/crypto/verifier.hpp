#ifndef PINSEAL_CRYPTO_VERIFIER_HPP
#define PINSEAL_CRYPTO_VERIFIER_HPP

#include "keypair.hpp"
#include <string>

namespace pinseal {
namespace verifier {

// Literal sealed inside every verifier
constexpr const char* VERIFY_PLAINTEXT = "sunday-e2e-verify";

// Seal VERIFY_PLAINTEXT for kp.public_key and return it as base64.
// Two calls return different values (ephemeral keys).
std::string create_verifier(const KeyPair& kp);

// True iff verifier_b64 decodes, opens with kp, and holds VERIFY_PLAINTEXT.
// Malformed or foreign verifiers return false. A libsodium initialisation
// failure still propagates as std::runtime_error.
bool verify(const KeyPair& kp, const std::string& verifier_b64);

} // namespace verifier
} // namespace pinseal

#endif // PINSEAL_CRYPTO_VERIFIER_HPP
