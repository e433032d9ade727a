#ifndef TBMCPS_DEBUG_LOG_HPP
#define TBMCPS_DEBUG_LOG_HPP

#include <chrono>
#include <string>

namespace debug_log {

// Returns true if TBMCPS_DEBUG env is set to a truthy value (1, true, yes),
// or if tracing was forced on with set_debug_enabled().
bool is_debug_enabled();

// Force tracing on or off for the rest of the process (the --verbose flag).
void set_debug_enabled(bool enabled);

// Writes message to stderr with [tbmcps] prefix only when is_debug_enabled().
void log(const std::string &message);

// Logs "<label> took N ms" on destruction when tracing is enabled.
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer &operator=(const ScopedTimer &) = delete;

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace debug_log

#endif // TBMCPS_DEBUG_LOG_HPP
