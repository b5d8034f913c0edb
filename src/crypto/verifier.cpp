#include "verifier.hpp"
#include "sealedbox.hpp"
#include "../errors.hpp"
#include <loguru.hpp>
#include <sodium.h>
#include <cstring>
#include <stdexcept>

namespace pinseal {
namespace verifier {

std::string create_verifier(const KeyPair& kp) {
    Bytes ciphertext = sealedbox::encrypt(kp.public_key, utils::to_bytes(VERIFY_PLAINTEXT));
    return utils::base64_encode(ciphertext);
}

bool verify(const KeyPair& kp, const std::string& verifier_b64) {
    Bytes plaintext;
    try {
        Bytes ciphertext = utils::base64_decode(verifier_b64);
        plaintext = sealedbox::decrypt(kp, ciphertext);
    } catch (const Error& e) {
        VLOG_F(1, "Verifier rejected: %s", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        VLOG_F(1, "Verifier rejected: %s", e.what());
        return false;
    }

    const size_t len = std::strlen(VERIFY_PLAINTEXT);
    return plaintext.size() == len &&
           sodium_memcmp(plaintext.data(), VERIFY_PLAINTEXT, len) == 0;
}

} // namespace verifier
} // namespace pinseal
