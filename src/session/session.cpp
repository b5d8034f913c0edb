#include "session.hpp"
#include "../crypto/kdf.hpp"
#include "../crypto/verifier.hpp"
#include "../errors.hpp"

#include <loguru.hpp>
#include <iostream>
#include <utility>

namespace pinseal {
namespace session {

void stderr_notifier(const std::string& message) {
    std::cerr << message << std::endl;
}

SessionKeyManager::SessionKeyManager(PinSource& source, Notifier notifier)
    : source_(source)
    , notify_(std::move(notifier))
{
}

SessionKeyManager::~SessionKeyManager() {
    clear_locked();
}

namespace {

// Wipes a PIN buffer on every exit path
class PinWipe {
public:
    explicit PinWipe(std::string& pin) : pin_(pin) {}
    ~PinWipe() { utils::wipe(pin_); }

    PinWipe(const PinWipe&) = delete;
    PinWipe& operator=(const PinWipe&) = delete;

private:
    std::string& pin_;
};

} // namespace

KeyPair SessionKeyManager::get_or_prompt(const std::string& salt_b64, const std::string& verifier_b64) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (cached_) {
            return *cached_;
        }
    }

    std::lock_guard<std::mutex> prompting(prompt_mu_);
    std::string prompt;
    {
        // Another caller may have unlocked while we waited
        std::lock_guard<std::mutex> lock(mu_);
        if (cached_) {
            return *cached_;
        }
        prompt = prompt_;
    }

    KeyPair kp = prompt_and_derive(prompt, salt_b64, verifier_b64);

    std::lock_guard<std::mutex> lock(mu_);
    cached_ = kp;
    return kp;
}

KeyPair SessionKeyManager::prompt_and_derive(const std::string& prompt,
                                             const std::string& salt_b64,
                                             const std::string& verifier_b64) {
    Bytes salt = utils::base64_decode(salt_b64);

    for (int attempt = 1; attempt <= MAX_PIN_ATTEMPTS; ++attempt) {
        std::string pin = source_.read_pin(prompt);
        PinWipe wipe_pin(pin);
        KeyPair kp = kdf::derive_keypair(pin, salt);

        if (verifier::verify(kp, verifier_b64)) {
            return kp;
        }
        kp.wipe();

        int remaining = MAX_PIN_ATTEMPTS - attempt;
        LOG_F(WARNING, "Incorrect PIN (attempt %d of %d)", attempt, MAX_PIN_ATTEMPTS);
        if (remaining > 0 && notify_) {
            notify_("Incorrect PIN. " + std::to_string(remaining) + " attempt(s) remaining.");
        }
    }

    LOG_F(ERROR, "Maximum PIN attempts exceeded");
    throw MaxAttemptsExceeded("maximum PIN attempts exceeded");
}

KeyPair SessionKeyManager::unlock(const Config& meta) {
    if (!meta.is_encryption_set_up()) {
        LOG_F(INFO, "Encryption not set up; skipping PIN prompt");
        throw EncryptionNotSetUp("encryption is not set up for this account");
    }
    if (!meta.pin_prompt.empty()) {
        set_prompt(meta.pin_prompt);
    }

    KeyPair kp = get_or_prompt(meta.pin_salt, meta.pin_verifier);

    if (kp.public_key_b64() != meta.public_key) {
        LOG_F(ERROR, "Derived public key %s... does not match the server record", kp.fingerprint().c_str());
        kp.wipe();
        std::lock_guard<std::mutex> lock(mu_);
        clear_locked();
        throw KeyMismatch("derived public key does not match server record (possible data corruption)");
    }
    return kp;
}

void SessionKeyManager::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    if (cached_) {
        LOG_F(INFO, "Cleared cached key pair");
    }
    clear_locked();
}

void SessionKeyManager::clear_locked() {
    if (cached_) {
        cached_->wipe();
        cached_.reset();
    }
}

bool SessionKeyManager::has_cached_keypair() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cached_.has_value();
}

void SessionKeyManager::set_prompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(mu_);
    prompt_ = prompt;
}

} // namespace session
} // namespace pinseal
