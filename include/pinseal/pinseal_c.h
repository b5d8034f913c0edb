#ifndef PINSEAL_C_H
#define PINSEAL_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*==============================================================================
 * Status codes
 *============================================================================*/
#define PINSEAL_OK                    0
#define PINSEAL_ERR                  -1
#define PINSEAL_ERR_INVALID_ARG      -2
#define PINSEAL_ERR_DECODE           -3
#define PINSEAL_ERR_DECRYPT          -4
#define PINSEAL_ERR_KEY_MISMATCH     -5
#define PINSEAL_ERR_PIN_FORMAT       -6
#define PINSEAL_ERR_NON_INTERACTIVE  -7
#define PINSEAL_ERR_MAX_ATTEMPTS     -8
#define PINSEAL_ERR_NOT_SET_UP       -9

/*==============================================================================
 * Opaque handles
 *============================================================================*/
typedef struct pinseal_keypair_t pinseal_keypair_t;
typedef struct pinseal_session_t pinseal_session_t;

/**
 * Supplies one PIN. Write a NUL-terminated string of at most out_len - 1
 * bytes to out_pin and return PINSEAL_OK, or return an error status
 * (PINSEAL_ERR_NON_INTERACTIVE when no secure input is available).
 */
typedef int (*pinseal_pin_callback)(void* user_data,
                                    const char* prompt,
                                    char* out_pin,
                                    size_t out_len);

/** Receives user-facing messages ("Incorrect PIN. ..."). */
typedef void (*pinseal_notify_callback)(void* user_data, const char* message);

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

/** Initialize the library. Call once at process start. */
int pinseal_init(void);

/** Free a heap-allocated string returned by pinseal_* functions. */
void pinseal_free_string(char* str);

/** Free a heap-allocated byte buffer returned by pinseal_* functions. */
void pinseal_free_bytes(unsigned char* buf);

/*==============================================================================
 * Key pairs
 *============================================================================*/

/**
 * Derive the key pair for (pin, salt). The salt is raw bytes (16).
 * Slow by design: Argon2id with 64 MiB of memory.
 */
int pinseal_keypair_derive(const char* pin,
                           const unsigned char* salt,
                           size_t salt_len,
                           pinseal_keypair_t** out);

/** Rebuild a key pair from base64 private and public halves. */
int pinseal_keypair_from_base64(const char* private_b64,
                                const char* public_b64,
                                pinseal_keypair_t** out);

/** Get the public key as base64. Caller must free with pinseal_free_string(). */
int pinseal_keypair_get_public_key(const pinseal_keypair_t* kp, char** out);

/** Wipe and free a key pair handle. */
void pinseal_keypair_destroy(pinseal_keypair_t* kp);

/*==============================================================================
 * Sealed boxes
 *============================================================================*/

/** Seal plaintext for a raw 32-byte public key. Free with pinseal_free_bytes(). */
int pinseal_seal(const unsigned char* public_key, size_t public_key_len,
                 const unsigned char* plaintext, size_t plaintext_len,
                 unsigned char** out, size_t* out_len);

/** Open a sealed box. Free with pinseal_free_bytes(). */
int pinseal_open(const pinseal_keypair_t* kp,
                 const unsigned char* ciphertext, size_t ciphertext_len,
                 unsigned char** out, size_t* out_len);

/*==============================================================================
 * Tagged fields
 *============================================================================*/

/** Returns 1 if value carries the "e2e::" prefix, 0 otherwise. */
int pinseal_is_encrypted(const char* value);

/** Decrypt a tagged field (untagged values are copied). Free with pinseal_free_string(). */
int pinseal_decrypt_field(const pinseal_keypair_t* kp, const char* value, char** out);

/** Encrypt a field for a base64 public key. Free with pinseal_free_string(). */
int pinseal_encrypt_field(const char* public_key_b64, const char* plaintext, char** out);

/*==============================================================================
 * Verifiers
 *============================================================================*/

/** Create a base64 verifier for kp. Free with pinseal_free_string(). */
int pinseal_create_verifier(const pinseal_keypair_t* kp, char** out);

/** Returns 1 if the verifier opens with kp, 0 otherwise. */
int pinseal_verify(const pinseal_keypair_t* kp, const char* verifier_b64);

/*==============================================================================
 * Sessions
 *============================================================================*/

/**
 * Create a session. pin_cb may be NULL to prompt on the terminal.
 * notify_cb may be NULL to write messages to stderr.
 * Both callbacks may call pinseal_session_has_cached_keypair and
 * pinseal_session_clear on the same session, but not get_or_prompt or unlock.
 */
int pinseal_session_create(pinseal_pin_callback pin_cb,
                           pinseal_notify_callback notify_cb,
                           void* user_data,
                           pinseal_session_t** out);

/** Return the cached key pair or prompt for the PIN. Destroy *out when done. */
int pinseal_session_get_or_prompt(pinseal_session_t* sess,
                                  const char* salt_b64,
                                  const char* verifier_b64,
                                  pinseal_keypair_t** out);

/**
 * Parse encryption metadata (PIN_SALT, PIN_VERIFIER, PUBLIC_KEY lines),
 * unlock, and check the derived public key against PUBLIC_KEY.
 * Returns PINSEAL_ERR_NOT_SET_UP without prompting when PUBLIC_KEY is empty.
 */
int pinseal_session_unlock(pinseal_session_t* sess,
                           const char* env_content,
                           pinseal_keypair_t** out);

/** 1 if a key pair is cached, 0 otherwise. */
int pinseal_session_has_cached_keypair(const pinseal_session_t* sess);

/** Drop the cached key pair. */
void pinseal_session_clear(pinseal_session_t* sess);

/** Free a session handle. */
void pinseal_session_destroy(pinseal_session_t* sess);

#ifdef __cplusplus
}
#endif

#endif /* PINSEAL_C_H */
