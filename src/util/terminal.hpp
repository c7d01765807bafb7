#pragma once

#include <termios.h>

namespace util {

/**
 * @brief Turns off echo on the controlling terminal for its lifetime
 *
 * Does nothing when stdin is not a terminal or when disabled, so piped
 * input and tests read exactly as before.
 */
class HiddenEcho {
    termios original_{};
    bool active_ = false;

public:
    explicit HiddenEcho(bool enabled);
    ~HiddenEcho();

    HiddenEcho(HiddenEcho const &)            = delete;
    HiddenEcho &operator=(HiddenEcho const &) = delete;

    bool active() const {
        return active_;
    }
};

} // namespace util
