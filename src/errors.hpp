#ifndef PINSEAL_ERRORS_HPP
#define PINSEAL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pinseal {

// Base class for every error raised by the library itself.
// Argument-shape problems (wrong key sizes) use std::invalid_argument instead.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed base64 at any boundary
class DecodingError : public Error {
public:
    explicit DecodingError(const std::string& what) : Error(what) {}
};

// Authentication failed, wrong key, or ciphertext below the sealed box overhead
class DecryptionFailure : public Error {
public:
    explicit DecryptionFailure(const std::string& what) : Error(what) {}
};

// A derived public key differs from the one recorded by the server
class KeyMismatch : public Error {
public:
    explicit KeyMismatch(const std::string& what) : Error(what) {}
};

class PinFormatError : public Error {
public:
    explicit PinFormatError(const std::string& what) : Error(what) {}
};

// No confidential input channel is available for a PIN prompt
class NonInteractiveInput : public Error {
public:
    explicit NonInteractiveInput(const std::string& what) : Error(what) {}
};

class MaxAttemptsExceeded : public Error {
public:
    explicit MaxAttemptsExceeded(const std::string& what) : Error(what) {}
};

// Argon2id failed (out of memory)
class DerivationError : public Error {
public:
    explicit DerivationError(const std::string& what) : Error(what) {}
};

// The account has no PIN setup on the server yet (no public key recorded)
class EncryptionNotSetUp : public Error {
public:
    explicit EncryptionNotSetUp(const std::string& what) : Error(what) {}
};

} // namespace pinseal

#endif // PINSEAL_ERRORS_HPP
