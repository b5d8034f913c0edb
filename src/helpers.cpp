#include "helpers.hpp"
#include "errors.hpp"
#include <loguru.hpp>
#include <sodium.h>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace pinseal {
namespace utils {

void ensure_sodium_init() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] {
        ok = sodium_init() >= 0;
        if (!ok) {
            LOG_F(ERROR, "Failed to initialize libsodium");
        }
    });
    if (!ok) throw std::runtime_error("Failed to initialize libsodium");
}

std::string bytes_to_hex(const Bytes& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : bytes) ss << std::setw(2) << static_cast<int>(byte);
    return ss.str();
}

Bytes hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) throw std::invalid_argument("Hex string length must be even.");
    Bytes bytes(hex.length() / 2);
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.c_str(), hex.length(),
                       nullptr, nullptr, nullptr) != 0) {
        throw std::invalid_argument("Invalid hex string.");
    }
    return bytes;
}

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string to_string(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

std::string base64_encode(const Bytes& bytes) {
    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_encoded_len(bytes.size(), variant), '\0');
    sodium_bin2base64(&out[0], out.size(), bytes.data(), bytes.size(), variant);
    // encoded_len counts the terminating NUL
    out.resize(out.size() - 1);
    return out;
}

Bytes base64_decode(const std::string& b64) {
    Bytes out(b64.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    // A null b64_end makes libsodium reject trailing garbage
    if (sodium_base642bin(out.data(), out.size(), b64.data(), b64.size(),
                          nullptr, &bin_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        throw DecodingError("decode: invalid base64");
    }
    out.resize(bin_len);
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\v\f";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return std::string();
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

void wipe(Bytes& b) {
    if (!b.empty()) sodium_memzero(b.data(), b.size());
}

void wipe(std::string& s) {
    if (!s.empty()) sodium_memzero(&s[0], s.size());
}

} // namespace utils
} // namespace pinseal
