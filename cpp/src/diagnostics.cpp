#include "debiaser/diagnostics.h"
#include <spdlog/spdlog.h>

namespace debiaser {

Diagnostics Diagnostics::spdlog_sink() {
    return Diagnostics([](LogLevel level, const std::string& msg) {
        switch (level) {
            case LogLevel::Warn: spdlog::warn("{}", msg); break;
            case LogLevel::Info: spdlog::info("{}", msg); break;
        }
    });
}

Diagnostics Diagnostics::null_sink() {
    return Diagnostics();
}

} // namespace debiaser
