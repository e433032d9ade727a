#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <utility>

namespace mcp_stdio {

LineChannel::LineChannel(std::istream &input) : state_(std::make_shared<SharedState>()) {
    std::shared_ptr<SharedState> state = state_;
    std::istream *stream = &input;
    reader_ = std::thread([state, stream]() {
        std::string line;
        while (std::getline(*stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->lines.push_back(std::move(line));
            }
            state->condition.notify_one();
            line.clear();
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->closed = true;
        }
        state->condition.notify_all();
    });
}

LineChannel::~LineChannel() {
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        closed = state_->closed;
    }
    if (!reader_.joinable()) {
        return;
    }
    // A reader still blocked on stdin (shutdown by signal) cannot be woken up;
    // it owns its share of the state and is left to die with the process.
    if (closed) {
        reader_.join();
    } else {
        reader_.detach();
    }
}

LineChannel::PopStatus LineChannel::pop(std::string &line, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->condition.wait_for(lock, wait, [this]() { return !state_->lines.empty() || state_->closed; });
    if (!state_->lines.empty()) {
        line = std::move(state_->lines.front());
        state_->lines.pop_front();
        return PopStatus::Line;
    }
    return state_->closed ? PopStatus::Closed : PopStatus::Timeout;
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

void log_message(const std::string &message) {
    std::cerr << "[tbmcps] " << message << std::endl;
}

} // namespace mcp_stdio
