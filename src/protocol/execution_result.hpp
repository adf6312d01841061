#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace sandrun::protocol {

    // What the service hands back. Owned by the caller; the service keeps no copy.
    struct ExecutionResult {
        std::string stdout_text;
        std::string stderr_text;
        bool stdout_truncated = false;
        bool stderr_truncated = false;

        // Empty only when the child was killed by the timeout. A crash by
        // signal reports 128 + signal here and the signal in term_signal.
        std::optional<int> exit_code;
        std::optional<int> term_signal;

        bool timed_out = false;
        std::int64_t duration_ms = 0;
    };

} // namespace sandrun::protocol
