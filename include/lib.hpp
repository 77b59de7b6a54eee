#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <sstream> // To build the final string

namespace ulidkit {

// Every failure the codec, generator and tool can raise.
enum class UlidErrc {
    InvalidLength,      // decode: input is not 26 characters
    InvalidCharacter,   // decode: character outside the Crockford alphabet
    Overflow,           // decode: first character above '7'
    OutOfRange,         // encode: timestamp or randomness wider than its field
    RandomnessOverflow, // generator: same-millisecond ID space exhausted
    ClockRegression,    // generator: clock moved backwards in strict mode
    Config              // configuration file or command line is unusable
};

const char* errc_name(UlidErrc code);

class UlidError : public std::runtime_error {
public:
    UlidError(UlidErrc code, const std::string& msg)
        : std::runtime_error(msg), code_(code) { }

    UlidErrc code() const noexcept { return code_; }

private:
    UlidErrc code_;
};

[[noreturn]] void error(UlidErrc code, const char* fmt, const char* file, int line, ...);

} // namespace ulidkit

// A helper macro to automatically pass __FILE__ and __LINE__
#define ULIDKIT_THROW(code, fmt, ...) ::ulidkit::error(code, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
