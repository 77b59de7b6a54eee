#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>

namespace ulidkit {

// Source of the random bytes that seed each fresh ULID.
class Entropy {
public:
    virtual ~Entropy() = default;
    virtual void fill(uint8_t* out, std::size_t n) = 0;
};

// Reads the operating system's random device (getrandom / /dev/urandom on Linux).
class SystemEntropy final : public Entropy {
private:
    std::random_device rd;
public:
    SystemEntropy() = default;
    ~SystemEntropy() override = default;

    void fill(uint8_t* out, std::size_t n) override {
        std::size_t i = 0;
        while (i < n) {
            auto word = static_cast<uint32_t>(rd());
            for (int b = 0; b < 4 && i < n; ++b, ++i) {
                out[i] = static_cast<uint8_t>(word >> (8 * b));
            }
        }
    }
};

// Helpers for ownership
using PEntropy = std::shared_ptr<Entropy>;

} // namespace ulidkit
