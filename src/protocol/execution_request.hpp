#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace sandrun::protocol {

    // The languages the service can execute. Every other identifier is
    // rejected before any workspace is created.
    enum class Language {
        Python,
        JavaScript
    };

    inline std::string to_string(const Language language) {
        switch (language) {
            case Language::Python:
                return "python";
            case Language::JavaScript:
                return "javascript";
            default:
                return "unknown";
        }
    }

    inline std::optional<Language> parse_language(const std::string& identifier) {
        if (identifier == "python") {
            return Language::Python;
        }
        if (identifier == "javascript") {
            return Language::JavaScript;
        }
        return std::nullopt;
    }

    // What the calling layer hands over. The language stays as the caller's
    // identifier so unsupported values can be reported verbatim.
    struct ExecutionRequest {
        std::string language;
        std::string source;
        std::optional<std::uint32_t> timeout_seconds;  // service default when empty
    };

} // namespace sandrun::protocol
