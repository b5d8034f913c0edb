#include "pinseal/pinseal_c.h"
#include "../crypto/field.hpp"
#include "../crypto/kdf.hpp"
#include "../crypto/sealedbox.hpp"
#include "../crypto/verifier.hpp"
#include "../session/session.hpp"
#include "../errors.hpp"
#include "../helpers.hpp"

#include <sodium.h>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace pinseal;

/*==============================================================================
 * Internal wrapper structs for opaque handles
 *============================================================================*/

struct pinseal_keypair_t {
    KeyPair kp;

    ~pinseal_keypair_t() { kp.wipe(); }
};

namespace {

// Adapts the C callback to session::PinSource
class CallbackPinSource : public session::PinSource {
public:
    CallbackPinSource(pinseal_pin_callback cb, void* user_data)
        : cb_(cb), user_data_(user_data) {}

    std::string read_pin(const std::string& prompt) override {
        std::vector<char> buf(64, '\0');
        int rc = cb_(user_data_, prompt.c_str(), buf.data(), buf.size());
        if (rc != PINSEAL_OK) {
            wipe_buffer(buf);
            if (rc == PINSEAL_ERR_PIN_FORMAT) {
                throw PinFormatError("PIN must be exactly 6 digits");
            }
            throw NonInteractiveInput("PIN callback failed with status " + std::to_string(rc));
        }
        buf.back() = '\0';
        std::string raw(buf.data());
        wipe_buffer(buf);

        try {
            std::string pin = session::validate_pin(raw);
            utils::wipe(raw);
            return pin;
        } catch (const PinFormatError&) {
            utils::wipe(raw);
            throw;
        }
    }

private:
    static void wipe_buffer(std::vector<char>& buf) {
        sodium_memzero(buf.data(), buf.size());
    }

    pinseal_pin_callback cb_;
    void*                user_data_;
};

} // namespace

struct pinseal_session_t {
    std::unique_ptr<session::PinSource>         source;
    std::unique_ptr<session::SessionKeyManager> manager;
};

/*==============================================================================
 * Helper functions
 *============================================================================*/

static char* copy_to_c_string(const std::string& str) {
    char* result = new char[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
}

static void copy_to_c_bytes(const Bytes& vec, unsigned char** out, size_t* out_len) {
    *out_len = vec.size();
    if (vec.empty()) {
        *out = nullptr;
        return;
    }
    *out = new unsigned char[*out_len];
    std::memcpy(*out, vec.data(), *out_len);
}

// Runs body and maps library exceptions to status codes
template <typename F>
static int guarded(F&& body) {
    try {
        body();
        return PINSEAL_OK;
    } catch (const DecodingError&) {
        return PINSEAL_ERR_DECODE;
    } catch (const DecryptionFailure&) {
        return PINSEAL_ERR_DECRYPT;
    } catch (const KeyMismatch&) {
        return PINSEAL_ERR_KEY_MISMATCH;
    } catch (const PinFormatError&) {
        return PINSEAL_ERR_PIN_FORMAT;
    } catch (const NonInteractiveInput&) {
        return PINSEAL_ERR_NON_INTERACTIVE;
    } catch (const MaxAttemptsExceeded&) {
        return PINSEAL_ERR_MAX_ATTEMPTS;
    } catch (const EncryptionNotSetUp&) {
        return PINSEAL_ERR_NOT_SET_UP;
    } catch (const std::invalid_argument&) {
        return PINSEAL_ERR_INVALID_ARG;
    } catch (const std::exception&) {
        return PINSEAL_ERR;
    }
}

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

int pinseal_init(void) {
    return guarded([] { utils::ensure_sodium_init(); });
}

void pinseal_free_string(char* str) {
    delete[] str;
}

void pinseal_free_bytes(unsigned char* buf) {
    delete[] buf;
}

/*==============================================================================
 * Key pairs
 *============================================================================*/

int pinseal_keypair_derive(const char* pin,
                           const unsigned char* salt,
                           size_t salt_len,
                           pinseal_keypair_t** out) {
    if (!pin || (!salt && salt_len > 0) || !out) return PINSEAL_ERR_INVALID_ARG;

    return guarded([&] {
        Bytes salt_bytes(salt, salt + salt_len);
        auto handle = std::make_unique<pinseal_keypair_t>();
        handle->kp = kdf::derive_keypair(std::string(pin), salt_bytes);
        *out = handle.release();
    });
}

int pinseal_keypair_from_base64(const char* private_b64,
                                const char* public_b64,
                                pinseal_keypair_t** out) {
    if (!private_b64 || !public_b64 || !out) return PINSEAL_ERR_INVALID_ARG;

    return guarded([&] {
        auto handle = std::make_unique<pinseal_keypair_t>();
        handle->kp = KeyPair::from_base64(private_b64, public_b64);
        *out = handle.release();
    });
}

int pinseal_keypair_get_public_key(const pinseal_keypair_t* kp, char** out) {
    if (!kp || !out) return PINSEAL_ERR_INVALID_ARG;

    return guarded([&] { *out = copy_to_c_string(kp->kp.public_key_b64()); });
}

void pinseal_keypair_destroy(pinseal_keypair_t* kp) {
    delete kp;
}

/*==============================================================================
 * Sealed boxes
 *============================================================================*/

int pinseal_seal(const unsigned char* public_key, size_t public_key_len,
                 const unsigned char* plaintext, size_t plaintext_len,
                 unsigned char** out, size_t* out_len) {
    if (!public_key || (!plaintext && plaintext_len > 0) || !out || !out_len) {
        return PINSEAL_ERR_INVALID_ARG;
    }

    return guarded([&] {
        Bytes pk(public_key, public_key + public_key_len);
        Bytes pt(plaintext, plaintext + plaintext_len);
        copy_to_c_bytes(sealedbox::encrypt(pk, pt), out, out_len);
    });
}

int pinseal_open(const pinseal_keypair_t* kp,
                 const unsigned char* ciphertext, size_t ciphertext_len,
                 unsigned char** out, size_t* out_len) {
    if (!kp || (!ciphertext && ciphertext_len > 0) || !out || !out_len) {
        return PINSEAL_ERR_INVALID_ARG;
    }

    return guarded([&] {
        Bytes ct(ciphertext, ciphertext + ciphertext_len);
        Bytes pt = sealedbox::decrypt(kp->kp, ct);
        copy_to_c_bytes(pt, out, out_len);
        utils::wipe(pt);
    });
}

/*==============================================================================
 * Tagged fields
 *============================================================================*/

int pinseal_is_encrypted(const char* value) {
    if (!value) return 0;
    return field::is_encrypted(value) ? 1 : 0;
}

int pinseal_decrypt_field(const pinseal_keypair_t* kp, const char* value, char** out) {
    if (!kp || !value || !out) return PINSEAL_ERR_INVALID_ARG;

    return guarded([&] {
        std::string plaintext = field::decrypt_field(value, kp->kp);
        *out = copy_to_c_string(plaintext);
        utils::wipe(plaintext);
    });
}

int pinseal_encrypt_field(const char* public_key_b64, const char* plaintext, char** out) {
    if (!public_key_b64 || !plaintext || !out) return PINSEAL_ERR_INVALID_ARG;

    return guarded([&] { *out = copy_to_c_string(field::encrypt_field(plaintext, public_key_b64)); });
}

/*==============================================================================
 * Verifiers
 *============================================================================*/

int pinseal_create_verifier(const pinseal_keypair_t* kp, char** out) {
    if (!kp || !out) return PINSEAL_ERR_INVALID_ARG;

    return guarded([&] { *out = copy_to_c_string(verifier::create_verifier(kp->kp)); });
}

int pinseal_verify(const pinseal_keypair_t* kp, const char* verifier_b64) {
    if (!kp || !verifier_b64) return 0;
    return verifier::verify(kp->kp, verifier_b64) ? 1 : 0;
}

/*==============================================================================
 * Sessions
 *============================================================================*/

int pinseal_session_create(pinseal_pin_callback pin_cb,
                           pinseal_notify_callback notify_cb,
                           void* user_data,
                           pinseal_session_t** out) {
    if (!out) return PINSEAL_ERR_INVALID_ARG;

    return guarded([&] {
        auto s = std::make_unique<pinseal_session_t>();
        if (pin_cb) {
            s->source = std::make_unique<CallbackPinSource>(pin_cb, user_data);
        } else {
            s->source = std::make_unique<session::TerminalPinSource>();
        }

        session::Notifier notifier = session::stderr_notifier;
        if (notify_cb) {
            notifier = [notify_cb, user_data](const std::string& msg) {
                notify_cb(user_data, msg.c_str());
            };
        }
        s->manager = std::make_unique<session::SessionKeyManager>(*s->source, notifier);
        *out = s.release();
    });
}

int pinseal_session_get_or_prompt(pinseal_session_t* sess,
                                  const char* salt_b64,
                                  const char* verifier_b64,
                                  pinseal_keypair_t** out) {
    if (!sess || !salt_b64 || !verifier_b64 || !out) return PINSEAL_ERR_INVALID_ARG;

    return guarded([&] {
        auto handle = std::make_unique<pinseal_keypair_t>();
        handle->kp = sess->manager->get_or_prompt(salt_b64, verifier_b64);
        *out = handle.release();
    });
}

int pinseal_session_unlock(pinseal_session_t* sess,
                           const char* env_content,
                           pinseal_keypair_t** out) {
    if (!sess || !env_content || !out) return PINSEAL_ERR_INVALID_ARG;

    return guarded([&] {
        auto meta = session::Config::from_env_string(env_content);
        auto handle = std::make_unique<pinseal_keypair_t>();
        handle->kp = sess->manager->unlock(meta);
        *out = handle.release();
    });
}

int pinseal_session_has_cached_keypair(const pinseal_session_t* sess) {
    if (!sess) return 0;
    return sess->manager->has_cached_keypair() ? 1 : 0;
}

void pinseal_session_clear(pinseal_session_t* sess) {
    if (sess) sess->manager->clear();
}

void pinseal_session_destroy(pinseal_session_t* sess) {
    delete sess;
}
