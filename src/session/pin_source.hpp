#ifndef PINSEAL_SESSION_PIN_SOURCE_HPP
#define PINSEAL_SESSION_PIN_SOURCE_HPP

#include <cstddef>
#include <string>

namespace pinseal {
namespace session {

constexpr size_t PIN_LENGTH = 6;

// Trim whitespace and require exactly PIN_LENGTH ASCII digits.
// Returns the trimmed PIN, throws PinFormatError otherwise.
std::string validate_pin(const std::string& raw);

// -----------------------------------------------------------------------------
// PinSource - where the session manager obtains PINs from
// -----------------------------------------------------------------------------
class PinSource {
public:
    virtual ~PinSource() = default;

    // Return a validated 6-digit PIN or throw
    virtual std::string read_pin(const std::string& prompt) = 0;
};

// -----------------------------------------------------------------------------
// TerminalPinSource - hidden-input prompt on the controlling terminal
// -----------------------------------------------------------------------------
// Prompts on stderr so the prompt shows even when stdout is redirected.
// Throws NonInteractiveInput when stdin is not a TTY.
class TerminalPinSource : public PinSource {
public:
    std::string read_pin(const std::string& prompt) override;
};

} // namespace session
} // namespace pinseal

#endif // PINSEAL_SESSION_PIN_SOURCE_HPP
