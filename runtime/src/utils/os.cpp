#include <gatecore/utils/os.h>

#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>

namespace gatecore::os {

int pid() {
    static const auto v = ::getpid();
    return v;
}

int tid() {
    static thread_local const auto v = static_cast<int>(::syscall(SYS_gettid));
    return v;
}

// Based on: https://github.com/agauniyal/rang/
bool is_color_terminal() noexcept {
    static const bool result = []() {
        if (std::getenv("COLORTERM") != nullptr) {
            return true;
        }

        static constexpr std::array<const char*, 16> terms = {{"ansi", "color", "console", "cygwin", "gnome", "konsole",
                                                               "kterm", "linux", "msys", "putty", "rxvt", "screen", "vt100",
                                                               "xterm", "alacritty", "vt102"}};
        const char* env_term_p = std::getenv("TERM");
        if (env_term_p == nullptr) {
            return false;
        }

        return std::any_of(terms.begin(), terms.end(),
                           [&](const char* term) { return std::strstr(env_term_p, term) != nullptr; });
    }();

    return result;
}

bool in_terminal(FILE* file) { return ::isatty(fileno(file)) != 0; }

}  // namespace gatecore::os
