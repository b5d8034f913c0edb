#ifndef PINSEAL_SESSION_SESSION_HPP
#define PINSEAL_SESSION_SESSION_HPP

#include "../crypto/keypair.hpp"
#include "config.hpp"
#include "pin_source.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace pinseal {
namespace session {

constexpr int MAX_PIN_ATTEMPTS = 3;

// Receives user-facing messages such as "Incorrect PIN. 2 attempt(s) remaining."
using Notifier = std::function<void(const std::string&)>;

// Writes the message and a newline to stderr
void stderr_notifier(const std::string& message);

// -----------------------------------------------------------------------------
// SessionKeyManager - Caches the PIN-derived key pair for one session
// -----------------------------------------------------------------------------
// Two states: empty and cached. A key pair is only cached after it opened the
// server verifier. Safe to share between threads; one PIN prompt runs at a
// time. The PinSource and Notifier are called without the state lock held, so
// they may call has_cached_keypair(), clear() and set_prompt(). They must not
// call get_or_prompt() or unlock() on the same manager.
class SessionKeyManager {
public:
    explicit SessionKeyManager(PinSource& source, Notifier notifier = stderr_notifier);
    ~SessionKeyManager();

    SessionKeyManager(const SessionKeyManager&) = delete;
    SessionKeyManager& operator=(const SessionKeyManager&) = delete;

    // Return the cached key pair, or prompt for the PIN (up to
    // MAX_PIN_ATTEMPTS times), derive and verify.
    // Throws DecodingError (bad salt), MaxAttemptsExceeded, and whatever the
    // PIN source throws.
    KeyPair get_or_prompt(const std::string& salt_b64, const std::string& verifier_b64);

    // get_or_prompt for the server metadata, then require the derived public
    // key to equal meta.public_key. Throws KeyMismatch (and drops the cache)
    // when it does not, and EncryptionNotSetUp without prompting when
    // meta.public_key is empty.
    KeyPair unlock(const Config& meta);

    // Discard the cached key pair. Idempotent.
    void clear();

    bool has_cached_keypair() const;

    void set_prompt(const std::string& prompt);

private:
    KeyPair prompt_and_derive(const std::string& prompt,
                              const std::string& salt_b64,
                              const std::string& verifier_b64);
    void clear_locked();

    PinSource&             source_;
    Notifier               notify_;
    std::string            prompt_ = DEFAULT_PIN_PROMPT;
    std::optional<KeyPair> cached_;
    mutable std::mutex     mu_;         // cached_, prompt_
    std::mutex             prompt_mu_;  // one prompt at a time
};

} // namespace session
} // namespace pinseal

#endif // PINSEAL_SESSION_SESSION_HPP
