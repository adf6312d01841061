#pragma once
#include <atomic>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace sandrun::core::config {

    // 16 random hex digits. random_device is thread-safe to construct per call,
    // and the engine is local so concurrent callers never share state.
    inline std::string random_hex(int digits = 16) {
        std::random_device rd;
        std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < digits; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // "req-<seq>-<hex>": the sequence number keeps ids unique within a process
    // even if two draws of the random part collide.
    inline std::string generate_request_id() {
        static std::atomic<std::uint64_t> sequence{0};
        std::stringstream ss;
        ss << "req-" << ++sequence << "-" << random_hex(8);
        return ss.str();
    }

} // namespace sandrun::core::config
