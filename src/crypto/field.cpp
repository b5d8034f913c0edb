#include "field.hpp"
#include "sealedbox.hpp"
#include "../errors.hpp"
#include <loguru.hpp>
#include <cstring>

namespace pinseal {
namespace field {

bool is_encrypted(const std::string& value) {
    return value.compare(0, std::strlen(ENCRYPTED_PREFIX), ENCRYPTED_PREFIX) == 0;
}

std::string decrypt_field(const std::string& value, const KeyPair& kp) {
    if (!is_encrypted(value)) {
        return value;
    }

    Bytes ciphertext = utils::base64_decode(value.substr(std::strlen(ENCRYPTED_PREFIX)));
    Bytes plaintext = sealedbox::decrypt(kp, ciphertext);
    std::string out = utils::to_string(plaintext);
    utils::wipe(plaintext);
    return out;
}

std::string encrypt_field(const std::string& plaintext, const std::string& public_key_b64) {
    if (plaintext.empty()) {
        return plaintext;
    }

    Bytes public_key = utils::base64_decode(public_key_b64);
    Bytes ciphertext = sealedbox::encrypt(public_key, utils::to_bytes(plaintext));
    return std::string(ENCRYPTED_PREFIX) + utils::base64_encode(ciphertext);
}

std::string try_decrypt_field(const std::string& value, const KeyPair& kp) {
    try {
        return decrypt_field(value, kp);
    } catch (const DecodingError& e) {
        LOG_F(WARNING, "Could not decrypt field: %s", e.what());
    } catch (const DecryptionFailure& e) {
        LOG_F(WARNING, "Could not decrypt field: %s", e.what());
    }
    return value;
}

} // namespace field
} // namespace pinseal
