#include "sealedbox.hpp"
#include "../errors.hpp"
#include <sodium.h>
#include <stdexcept>

namespace pinseal {
namespace sealedbox {

static_assert(SEAL_OVERHEAD == crypto_box_SEALBYTES, "sealed box overhead must match libsodium");

Bytes encrypt(const Bytes& recipient_public_key, const Bytes& plaintext) {
    utils::ensure_sodium_init();

    if (recipient_public_key.size() != crypto_box_PUBLICKEYBYTES) {
        throw std::invalid_argument("Invalid public key size: expected " +
            std::to_string(crypto_box_PUBLICKEYBYTES) + ", got " +
            std::to_string(recipient_public_key.size()));
    }

    Bytes ciphertext(plaintext.size() + crypto_box_SEALBYTES);

    if (crypto_box_seal(ciphertext.data(),
                        plaintext.data(),
                        plaintext.size(),
                        recipient_public_key.data()) != 0) {
        throw std::runtime_error("Encryption failed");
    }

    return ciphertext;
}

Bytes decrypt(const KeyPair& recipient, const Bytes& ciphertext) {
    utils::ensure_sodium_init();

    if (recipient.private_key.size() != crypto_box_SECRETKEYBYTES) {
        throw std::invalid_argument("Invalid private key size: expected " +
            std::to_string(crypto_box_SECRETKEYBYTES) + ", got " +
            std::to_string(recipient.private_key.size()));
    }

    if (recipient.public_key.size() != crypto_box_PUBLICKEYBYTES) {
        throw std::invalid_argument("Invalid public key size: expected " +
            std::to_string(crypto_box_PUBLICKEYBYTES) + ", got " +
            std::to_string(recipient.public_key.size()));
    }

    if (ciphertext.size() < crypto_box_SEALBYTES) {
        throw DecryptionFailure("Ciphertext too short: minimum " +
            std::to_string(crypto_box_SEALBYTES) + " bytes required");
    }

    Bytes plaintext(ciphertext.size() - crypto_box_SEALBYTES);

    if (crypto_box_seal_open(plaintext.data(),
                             ciphertext.data(),
                             ciphertext.size(),
                             recipient.public_key.data(),
                             recipient.private_key.data()) != 0) {
        utils::wipe(plaintext);
        throw DecryptionFailure("Decryption failed: invalid ciphertext or wrong key");
    }

    return plaintext;
}

} // namespace sealedbox
} // namespace pinseal
