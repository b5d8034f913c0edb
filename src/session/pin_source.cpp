#include "pin_source.hpp"
#include "../errors.hpp"
#include "../helpers.hpp"

#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <string>

namespace pinseal {
namespace session {

std::string validate_pin(const std::string& raw) {
    std::string pin = utils::trim(raw);
    bool ok = pin.size() == PIN_LENGTH &&
              std::all_of(pin.begin(), pin.end(), [](char c) { return c >= '0' && c <= '9'; });
    if (!ok) {
        utils::wipe(pin);
        throw PinFormatError("PIN must be exactly 6 digits");
    }
    return pin;
}

namespace {

// Disables terminal echo for its lifetime
class EchoGuard {
public:
    explicit EchoGuard(int fd) : fd_(fd) {
        active_ = tcgetattr(fd_, &saved_) == 0;
        if (active_) {
            termios quiet = saved_;
            quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            active_ = tcsetattr(fd_, TCSANOW, &quiet) == 0;
        }
    }

    ~EchoGuard() {
        if (active_) tcsetattr(fd_, TCSANOW, &saved_);
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

} // namespace

std::string TerminalPinSource::read_pin(const std::string& prompt) {
    if (!isatty(STDIN_FILENO)) {
        throw NonInteractiveInput("PIN prompt requires an interactive terminal (stdin is not a TTY)");
    }

    std::cerr << prompt << std::flush;

    std::string line;
    bool got_line = false;
    {
        EchoGuard guard(STDIN_FILENO);
        if (!guard.active()) {
            throw NonInteractiveInput("PIN prompt could not disable terminal echo");
        }
        got_line = static_cast<bool>(std::getline(std::cin, line));
    }
    // Hidden input leaves the cursor on the prompt line
    std::cerr << std::endl;

    if (!got_line) {
        throw NonInteractiveInput("reading PIN: end of input");
    }

    try {
        std::string pin = validate_pin(line);
        utils::wipe(line);
        return pin;
    } catch (const PinFormatError&) {
        utils::wipe(line);
        throw;
    }
}

} // namespace session
} // namespace pinseal
