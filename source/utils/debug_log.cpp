#include "utils/debug_log.hpp"
#include "utils/text_utils.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace debug_log {

namespace {

// -1: not decided yet (read the environment), 0: off, 1: on.
std::atomic<int> debug_state{-1};

bool read_environment_flag() {
    const char *value = std::getenv("TBMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = text_utils::to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

} // namespace

bool is_debug_enabled() {
    int state = debug_state.load();
    if (state < 0) {
        state = read_environment_flag() ? 1 : 0;
        debug_state.store(state);
    }
    return state == 1;
}

void set_debug_enabled(bool enabled) {
    debug_state.store(enabled ? 1 : 0);
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::cerr << "[tbmcps] " << message << std::endl;
}

ScopedTimer::ScopedTimer(std::string label)
    : label_(std::move(label)), start_time_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    if (!is_debug_enabled()) {
        return;
    }
    auto elapsed = std::chrono::steady_clock::now() - start_time_;
    long long elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    log(label_ + " took " + std::to_string(elapsed_milliseconds) + " ms");
}

} // namespace debug_log
