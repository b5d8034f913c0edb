#include "config.hpp"
#include "../helpers.hpp"

#include <sstream>
#include <stdexcept>

namespace pinseal {
namespace session {

bool Config::is_encryption_set_up() const {
    return !public_key.empty();
}

std::string Config::to_env_string() const {
    std::ostringstream oss;
    oss << "PIN_SALT=" << pin_salt << "\n";
    oss << "PIN_VERIFIER=" << pin_verifier << "\n";
    oss << "PUBLIC_KEY=" << public_key << "\n";
    oss << "PIN_PROMPT=" << pin_prompt << "\n";
    return oss.str();
}

Config Config::from_env_string(const std::string& env_content) {
    Config cfg;
    std::istringstream iss(env_content);
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(iss, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::string trimmed = utils::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("config: line " + std::to_string(line_no) + " is not KEY=value");
        }

        std::string key = utils::trim(line.substr(0, eq));
        std::string value = line.substr(eq + 1);

        if (key == "PIN_SALT") {
            cfg.pin_salt = utils::trim(value);
        } else if (key == "PIN_VERIFIER") {
            cfg.pin_verifier = utils::trim(value);
        } else if (key == "PUBLIC_KEY") {
            cfg.public_key = utils::trim(value);
        } else if (key == "PIN_PROMPT") {
            // Kept verbatim, trailing space included
            cfg.pin_prompt = value;
        }
    }

    return cfg;
}

} // namespace session
} // namespace pinseal
