#include <util/terminal.hpp>

#include <unistd.h>

namespace util {

HiddenEcho::HiddenEcho(bool enabled) {
    if(not enabled or ::isatty(STDIN_FILENO) != 1)
        return;
    if(::tcgetattr(STDIN_FILENO, &original_) != 0)
        return;

    auto hidden = original_;
    hidden.c_lflag &= static_cast<tcflag_t>(~ECHO);
    active_ = ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &hidden) == 0;
}

HiddenEcho::~HiddenEcho() {
    if(active_)
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_);
}

} // namespace util
