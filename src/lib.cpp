#include "lib.hpp"

namespace ulidkit {

const char* errc_name(UlidErrc code) {
    switch (code) {
        case UlidErrc::InvalidLength:      return "InvalidLength";
        case UlidErrc::InvalidCharacter:   return "InvalidCharacter";
        case UlidErrc::Overflow:           return "Overflow";
        case UlidErrc::OutOfRange:         return "OutOfRange";
        case UlidErrc::RandomnessOverflow: return "RandomnessOverflow";
        case UlidErrc::ClockRegression:    return "ClockRegression";
        case UlidErrc::Config:             return "Config";
    }
    return "Unknown";
}

// Formats the printf-style message, prefixes the call site and throws a UlidError.
    void error(UlidErrc code, const char* fmt, const char* file, int line, ...) {
        va_list args;
        va_start(args, line);

        // Two passes: size the message first, then write it.
        va_list args_copy;
        va_copy(args_copy, args);
        int required_size = std::vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (required_size < 0) {
            va_end(args);
            throw UlidError(code, "Error: Failed to determine required buffer size.");
        }

        std::vector<char> buffer(required_size + 1);
        std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        va_end(args);

        std::stringstream ss;
        ss << file << ":" << line << ": " << buffer.data();

        throw UlidError(code, ss.str());
    }

} // namespace ulidkit
