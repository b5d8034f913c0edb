#include "keypair.hpp"
#include <sodium.h>
#include <algorithm>
#include <stdexcept>

namespace pinseal {

using utils::base64_decode;
using utils::base64_encode;

KeyPair KeyPair::from_base64(const std::string& private_b64, const std::string& public_b64) {
    KeyPair kp;
    kp.private_key = base64_decode(private_b64);
    if (kp.private_key.size() != PRIVATE_KEY_SIZE) {
        size_t got = kp.private_key.size();
        kp.wipe();
        throw std::invalid_argument("private key has invalid length " + std::to_string(got) +
            ", expected " + std::to_string(PRIVATE_KEY_SIZE));
    }

    kp.public_key = base64_decode(public_b64);
    if (kp.public_key.size() != PUBLIC_KEY_SIZE) {
        size_t got = kp.public_key.size();
        kp.wipe();
        throw std::invalid_argument("public key has invalid length " + std::to_string(got) +
            ", expected " + std::to_string(PUBLIC_KEY_SIZE));
    }
    return kp;
}

std::string KeyPair::public_key_b64() const {
    return base64_encode(public_key);
}

std::string KeyPair::fingerprint() const {
    Bytes head(public_key.begin(), public_key.begin() + std::min<size_t>(4, public_key.size()));
    return utils::bytes_to_hex(head);
}

void KeyPair::wipe() {
    utils::wipe(private_key);
    utils::wipe(public_key);
}

bool operator==(const KeyPair& a, const KeyPair& b) {
    if (a.public_key.size() != b.public_key.size() ||
        a.private_key.size() != b.private_key.size()) {
        return false;
    }
    // Constant-time over the secret half
    bool priv_eq = a.private_key.empty() ||
        sodium_memcmp(a.private_key.data(), b.private_key.data(), a.private_key.size()) == 0;
    return priv_eq && a.public_key == b.public_key;
}

bool operator!=(const KeyPair& a, const KeyPair& b) {
    return !(a == b);
}

} // namespace pinseal
