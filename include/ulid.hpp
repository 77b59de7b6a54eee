#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include "lib.hpp"

namespace ulidkit {

class Entropy; // fw decl

constexpr std::size_t ULID_LENGTH    = 26;
constexpr std::size_t ULID_BYTES     = 16;
constexpr std::size_t RANDOM_BYTES   = 10;
constexpr uint64_t    MAX_TIMESTAMP  = (uint64_t(1) << 48) - 1;
constexpr uint64_t    MAX_RAND_HI    = 0xFFFF; // randomness bits 79..64

// Crockford Base32 alphabet
constexpr const char* CROCKFORD = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

struct DecodeResult;

/**
 * ULID: 48-bit millisecond timestamp followed by 80 bits of randomness.
 *
 * Stored as two words: high = timestamp << 16 | randomness[79..64],
 * low = randomness[63..0]. Comparing (high, low) gives the same order as
 * comparing canonical strings.
 */
class ULID {
public:
    using Bytes = std::array<uint8_t, ULID_BYTES>;

    ULID() = default; // nil ULID, all zero

    // Throws UlidError(OutOfRange) when timestamp > 2^48-1 or rand_hi > 0xFFFF.
    ULID(uint64_t timestamp, uint64_t rand_hi, uint64_t rand_lo);

    static ULID from_bytes(const Bytes& bytes);

    // One-off ULID with fresh randomness; no ordering with other calls.
    static ULID from_random(uint64_t timestamp, Entropy& entropy);

    // Canonical 26-character string for (timestamp, randomness).
    static std::string encode(uint64_t timestamp, uint64_t rand_hi, uint64_t rand_lo);

    // Throws UlidError with InvalidLength, InvalidCharacter or Overflow.
    static ULID decode(std::string_view text);

    // Same checks as decode() but reports the failure in the result.
    static DecodeResult try_decode(std::string_view text);

    static bool is_valid(std::string_view text);

    // Timestamp carried by a ULID string (the whole string is validated).
    static uint64_t timestamp_of(std::string_view text);

    std::string str() const;
    Bytes bytes() const;

    uint64_t timestamp_ms() const { return high_ >> 16; }
    std::chrono::system_clock::time_point time_point() const;
    uint64_t rand_hi() const { return high_ & MAX_RAND_HI; }
    uint64_t rand_lo() const { return low_; }
    uint64_t high() const { return high_; }
    uint64_t low() const { return low_; }
    bool is_nil() const { return high_ == 0 && low_ == 0; }

    bool operator==(const ULID& o) const { return high_ == o.high_ && low_ == o.low_; }
    bool operator!=(const ULID& o) const { return !(*this == o); }
    bool operator<(const ULID& o) const {
        return high_ != o.high_ ? high_ < o.high_ : low_ < o.low_;
    }
    bool operator>(const ULID& o) const { return o < *this; }
    bool operator<=(const ULID& o) const { return !(o < *this); }
    bool operator>=(const ULID& o) const { return !(*this < o); }

private:
    uint64_t high_ = 0;
    uint64_t low_  = 0;
};

struct DecodeResult {
    bool        ok = false;
    ULID        value {};
    UlidErrc    error { UlidErrc::InvalidLength }; // meaningful only when !ok
    std::string message;
    std::size_t position = 0; // offending index for InvalidCharacter
};

} // namespace ulidkit

namespace std {
template <>
struct hash<ulidkit::ULID> {
    std::size_t operator()(const ulidkit::ULID& u) const noexcept {
        std::size_t h = std::hash<uint64_t> {}(u.high());
        return h ^ (std::hash<uint64_t> {}(u.low()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
} // namespace std
