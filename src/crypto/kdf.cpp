#include "kdf.hpp"
#include "../errors.hpp"
#include <botan/exceptn.h>
#include <botan/pwdhash.h>
#include <loguru.hpp>
#include <sodium.h>
#include <stdexcept>

namespace pinseal {
namespace kdf {

static_assert(SALT_SIZE == crypto_pwhash_SALTBYTES, "salt size must match libsodium");
static_assert(SEED_SIZE == crypto_box_SEEDBYTES, "seed size must match libsodium");

namespace {

// crypto_pwhash only takes crypto_pwhash_SALTBYTES of salt; Botan's Argon2id
// takes any length with the same parameters.
Bytes derive_seed_any_salt(const std::string& pin, const Bytes& salt) {
    Bytes seed(SEED_SIZE);
    try {
        auto family = Botan::PasswordHashFamily::create_or_throw("Argon2id");
        auto argon2 = family->from_params(MEM_LIMIT / 1024, OPS_LIMIT, PARALLELISM);
        argon2->derive_key(seed.data(), seed.size(),
                           pin.data(), pin.size(),
                           salt.data(), salt.size());
    } catch (const Botan::Exception& e) {
        utils::wipe(seed);
        LOG_F(ERROR, "Argon2id derivation failed: %s", e.what());
        throw DerivationError("Key derivation failed");
    }
    return seed;
}

} // namespace

Bytes derive_seed(const std::string& pin, const Bytes& salt) {
    utils::ensure_sodium_init();

    if (salt.size() != crypto_pwhash_SALTBYTES) {
        return derive_seed_any_salt(pin, salt);
    }

    Bytes seed(SEED_SIZE);
    if (crypto_pwhash(seed.data(), seed.size(),
                      pin.data(), pin.size(),
                      salt.data(),
                      OPS_LIMIT,
                      MEM_LIMIT,
                      crypto_pwhash_ALG_ARGON2ID13) != 0) {
        LOG_F(ERROR, "Argon2id derivation failed (out of memory?)");
        throw DerivationError("Key derivation failed");
    }
    return seed;
}

KeyPair keypair_from_seed(const Bytes& seed) {
    utils::ensure_sodium_init();

    if (seed.size() != SEED_SIZE) {
        throw std::invalid_argument("Invalid seed size: expected " +
            std::to_string(SEED_SIZE) + ", got " + std::to_string(seed.size()));
    }

    Bytes hash(crypto_hash_sha512_BYTES);
    crypto_hash_sha512(hash.data(), seed.data(), seed.size());

    KeyPair kp;
    kp.private_key.assign(hash.begin(), hash.begin() + PRIVATE_KEY_SIZE);
    utils::wipe(hash);

    kp.private_key[0] &= 248;
    kp.private_key[31] &= 127;
    kp.private_key[31] |= 64;

    kp.public_key.resize(PUBLIC_KEY_SIZE);
    if (crypto_scalarmult_base(kp.public_key.data(), kp.private_key.data()) != 0) {
        kp.wipe();
        throw DerivationError("Failed to derive public key");
    }
    return kp;
}

KeyPair derive_keypair(const std::string& pin, const Bytes& salt) {
    Bytes seed = derive_seed(pin, salt);
    KeyPair kp = keypair_from_seed(seed);
    utils::wipe(seed);

    LOG_F(INFO, "Derived key pair (public key %s...)", kp.fingerprint().c_str());
    return kp;
}

bool is_clamped(const Bytes& private_key) {
    if (private_key.size() != PRIVATE_KEY_SIZE) return false;
    return (private_key[0] & 7) == 0 &&
           (private_key[31] & 128) == 0 &&
           (private_key[31] & 64) == 64;
}

} // namespace kdf
} // namespace pinseal
