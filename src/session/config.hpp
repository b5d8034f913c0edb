#ifndef PINSEAL_SESSION_CONFIG_HPP
#define PINSEAL_SESSION_CONFIG_HPP

#include <string>

namespace pinseal {
namespace session {

constexpr const char* DEFAULT_PIN_PROMPT = "Enter your 6-digit encryption PIN: ";

// -----------------------------------------------------------------------------
// Config - Encryption metadata recorded by the server for one user
// -----------------------------------------------------------------------------
// All three blobs are kept exactly as received (standard base64); the library
// decodes them itself.
struct Config {
    std::string pin_salt;      // base64, 16 bytes
    std::string pin_verifier;  // base64 sealed box of the verifier constant
    std::string public_key;    // base64, 32 bytes
    std::string pin_prompt = DEFAULT_PIN_PROMPT;

    // False until the user has finished PIN setup on the server
    bool is_encryption_set_up() const;

    // Serialize to environment variable format (KEY=value lines)
    std::string to_env_string() const;

    // Deserialize from environment variable format
    static Config from_env_string(const std::string& env_content);
};

} // namespace session
} // namespace pinseal

#endif // PINSEAL_SESSION_CONFIG_HPP
