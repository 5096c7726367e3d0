#include "idtoken/log.hpp"

#include "idtoken/constants.hpp"
#include "idtoken/env.hpp"

#include <atomic>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace idtoken::log {

namespace {
    // -1 = not decided yet
    std::atomic<int> g_colors{-1};
    std::atomic<int> g_debug{-1};

    void Emit(const char* prefix, const char* color, const std::string& message) {
        std::cerr << Colorize(prefix, color) << " " << message << "\n";
    }
}

bool ColorsEnabled(std::ostream& os) {
    int state = g_colors.load(std::memory_order_relaxed);
    if (state >= 0) {
        return state == 1;
    }
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_colors.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

bool DebugEnabled() {
    int state = g_debug.load(std::memory_order_relaxed);
    if (state < 0) {
        state = env::IsEnabled(constants::kEnvDebug) ? 1 : 0;
        g_debug.store(state, std::memory_order_relaxed);
    }
    return state == 1;
}

void SetDebugEnabled(bool enabled) {
    g_debug.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

void Debug(const std::string& message) {
    if (!DebugEnabled()) {
        return;
    }
    Emit("DEBUG:", color::BRIGHT_BLACK, message);
}

void Warn(const std::string& message) {
    Emit("WARN:", color::YELLOW, message);
}

void Error(const std::string& message) {
    Emit("Error:", color::BOLD_RED, message);
}

}  // namespace idtoken::log
