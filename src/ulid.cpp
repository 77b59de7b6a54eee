#include "ulid.hpp"
#include "entropy.hpp"
#include <format>

namespace ulidkit {

namespace {

    constexpr uint8_t BAD = 0xFF;

    // Case-insensitive reverse of CROCKFORD; I, L, O and U stay invalid.
    constexpr std::array<uint8_t, 256> make_decode_table() {
        std::array<uint8_t, 256> t {};
        for (auto& v : t) v = BAD;
        for (int i = 0; i < 32; ++i) {
            const char c = CROCKFORD[i];
            t[static_cast<uint8_t>(c)] = static_cast<uint8_t>(i);
            if (c >= 'A' && c <= 'Z')
                t[static_cast<uint8_t>(c - 'A' + 'a')] = static_cast<uint8_t>(i);
        }
        return t;
    }

    constexpr std::array<uint8_t, 256> DECODE = make_decode_table();

    // 5-bit group of the 128-bit value (high:low) whose lowest bit sits at 'shift'.
    inline unsigned group_at(uint64_t high, uint64_t low, int shift) {
        uint64_t v;
        if (shift >= 64)     v = high >> (shift - 64);
        else if (shift == 0) v = low;
        else                 v = (low >> shift) | (high << (64 - shift));
        return static_cast<unsigned>(v & 0x1F);
    }

    std::string encode_words(uint64_t high, uint64_t low) {
        // 130-bit view: two zero pad bits on top, so char 0 only holds 3 bits.
        std::string out(ULID_LENGTH, '0');
        for (std::size_t i = 0; i < ULID_LENGTH; ++i) {
            int shift = 125 - 5 * static_cast<int>(i);
            out[i] = CROCKFORD[group_at(high, low, shift)];
        }
        return out;
    }

    std::string describe(char c) {
        const auto u = static_cast<unsigned char>(c);
        if (u >= 0x20 && u < 0x7F) return std::format("'{}'", c);
        return std::format("\\x{:02X}", static_cast<unsigned>(u));
    }

} // namespace

ULID::ULID(uint64_t timestamp, uint64_t rand_hi, uint64_t rand_lo) {
    if (timestamp > MAX_TIMESTAMP) {
        ULIDKIT_THROW(UlidErrc::OutOfRange, "timestamp %llu does not fit in 48 bits",
                      static_cast<unsigned long long>(timestamp));
    }
    if (rand_hi > MAX_RAND_HI) {
        ULIDKIT_THROW(UlidErrc::OutOfRange, "randomness high part 0x%llx does not fit in 16 bits",
                      static_cast<unsigned long long>(rand_hi));
    }
    high_ = (timestamp << 16) | rand_hi;
    low_  = rand_lo;
}

ULID ULID::from_bytes(const Bytes& bytes) {
    ULID u;
    for (std::size_t i = 0; i < 8; ++i) {
        u.high_ = (u.high_ << 8) | bytes[i];
        u.low_  = (u.low_ << 8) | bytes[i + 8];
    }
    return u;
}

ULID ULID::from_random(uint64_t timestamp, Entropy& entropy) {
    uint8_t r[RANDOM_BYTES];
    entropy.fill(r, RANDOM_BYTES);
    uint64_t hi = (uint64_t(r[0]) << 8) | r[1];
    uint64_t lo = 0;
    for (std::size_t i = 2; i < RANDOM_BYTES; ++i) lo = (lo << 8) | r[i];
    return ULID(timestamp, hi, lo);
}

std::string ULID::encode(uint64_t timestamp, uint64_t rand_hi, uint64_t rand_lo) {
    return ULID(timestamp, rand_hi, rand_lo).str();
}

DecodeResult ULID::try_decode(std::string_view text) {
    DecodeResult r;
    if (text.size() != ULID_LENGTH) {
        r.error   = UlidErrc::InvalidLength;
        r.message = std::format("invalid ULID length {}, expected {}", text.size(), ULID_LENGTH);
        return r;
    }

    uint64_t high = 0, low = 0;
    for (std::size_t i = 0; i < ULID_LENGTH; ++i) {
        const uint8_t v = DECODE[static_cast<uint8_t>(text[i])];
        if (v == BAD) {
            r.error    = UlidErrc::InvalidCharacter;
            r.position = i;
            r.message  = std::format("invalid character {} at position {}", describe(text[i]), i);
            return r;
        }
        high = (high << 5) | (low >> 59);
        low  = (low << 5) | v;
    }

    // 26 chars carry 130 bits; the first one may only use its low 3.
    if (DECODE[static_cast<uint8_t>(text[0])] > 7) {
        r.error   = UlidErrc::Overflow;
        r.message = std::format("ULID overflow: first character {} exceeds '7'", describe(text[0]));
        return r;
    }

    r.ok = true;
    r.value.high_ = high;
    r.value.low_  = low;
    return r;
}

ULID ULID::decode(std::string_view text) {
    DecodeResult r = try_decode(text);
    if (!r.ok) ULIDKIT_THROW(r.error, "%s", r.message.c_str());
    return r.value;
}

bool ULID::is_valid(std::string_view text) {
    return try_decode(text).ok;
}

uint64_t ULID::timestamp_of(std::string_view text) {
    return decode(text).timestamp_ms();
}

std::string ULID::str() const {
    return encode_words(high_, low_);
}

ULID::Bytes ULID::bytes() const {
    Bytes b {};
    for (std::size_t i = 0; i < 8; ++i) {
        b[i]     = static_cast<uint8_t>(high_ >> (56 - 8 * i));
        b[i + 8] = static_cast<uint8_t>(low_ >> (56 - 8 * i));
    }
    return b;
}

std::chrono::system_clock::time_point ULID::time_point() const {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(timestamp_ms())));
}

} // namespace ulidkit
