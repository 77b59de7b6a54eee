#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "clock.hpp"
#include "entropy.hpp"
#include "ulid.hpp"

namespace ulidkit {

// What to do when the clock reads earlier than the last ID's timestamp.
enum class ClockPolicy {
    Monotonic, // keep the last timestamp and increment the randomness
    Strict     // throw UlidError(ClockRegression)
};

ClockPolicy clockpolicy(const std::string& name);
std::string clockpolicy(ClockPolicy policy);

// The monotonic ULID generator.
// IDs from one instance are strictly increasing; next() is safe to call from several threads.
class Generator {
public:
    explicit Generator(PClock clock = std::make_shared<SystemClock>(),
                       PEntropy entropy = std::make_shared<SystemEntropy>(),
                       ClockPolicy policy = ClockPolicy::Monotonic);

    // Generates the next ULID.
    // Throws RandomnessOverflow when the same-millisecond space is used up,
    // ClockRegression in strict mode when the clock moved backwards.
    ULID next();

    // 'count' IDs under one lock. On failure nothing is returned and the
    // generator state is left as it was before the call.
    std::vector<ULID> next_batch(std::size_t count);

    ClockPolicy policy() const { return policy_; }

private:
    // Last ID handed out.
    struct State {
        bool     fresh = true;
        uint64_t last_timestamp = 0;
        uint64_t last_rand_hi = 0; // randomness bits 79..64
        uint64_t last_rand_lo = 0; // randomness bits 63..0
    };

    ULID step(State& state);
    void draw(State& state, uint64_t timestamp);
    static void increment(State& state);

    PClock clock_;
    PEntropy entropy_;
    ClockPolicy policy_;

    State state_;

    // A mutex for thread-safe generation.
    std::mutex mutex_;
};

} // namespace ulidkit
