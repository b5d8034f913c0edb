#ifndef PINSEAL_HELPERS_HPP
#define PINSEAL_HELPERS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pinseal {

using Bytes = std::vector<uint8_t>;

namespace utils {

    // Initialize libsodium once per process (thread-safe, throws on failure)
    void ensure_sodium_init();

    // Hex helpers
    std::string bytes_to_hex(const Bytes& bytes);
    Bytes hex_to_bytes(const std::string& hex);

    Bytes to_bytes(const std::string& s);
    std::string to_string(const Bytes& b);

    // Standard (RFC 4648, padded) base64. Decoding is strict: no whitespace,
    // no URL-safe alphabet, correct padding. Throws DecodingError.
    std::string base64_encode(const Bytes& bytes);
    Bytes base64_decode(const std::string& b64);

    // Strip leading and trailing ASCII whitespace
    std::string trim(const std::string& s);

    // Zero a buffer with sodium_memzero
    void wipe(Bytes& b);
    void wipe(std::string& s);

} // namespace utils
} // namespace pinseal

#endif // PINSEAL_HELPERS_HPP
