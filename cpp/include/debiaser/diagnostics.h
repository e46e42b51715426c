#pragma once
#include <functional>
#include <utility>
#include <string>
#include "debiaser/types.h"

namespace debiaser {

// Injected diagnostic sink. Components never log to a global directly;
// they receive a Diagnostics at construction and report through it.
class Diagnostics {
public:
    using Callback = std::function<void(LogLevel, const std::string&)>;

    Diagnostics() = default;
    explicit Diagnostics(Callback cb) : cb_(std::move(cb)) {}

    // Forward to spdlog's default logger.
    static Diagnostics spdlog_sink();
    // Discard everything.
    static Diagnostics null_sink();

    void info(const std::string& msg) const { emit(LogLevel::Info, msg); }
    void warn(const std::string& msg) const { emit(LogLevel::Warn, msg); }

private:
    void emit(LogLevel level, const std::string& msg) const {
        if (cb_) cb_(level, msg);
    }

    Callback cb_;
};

} // namespace debiaser
