#include "catch.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "fake_sources.hpp"
#include "generator.hpp"

using namespace std::chrono_literals;
using namespace ulidkit;

TEST_CASE("First call uses the clock and fresh randomness", "[generator]") {
    auto entropy = std::make_shared<CountingEntropy>();
    Generator gen(std::make_shared<FixedClock>(1000), entropy);

    ULID id = gen.next();
    CHECK(id.timestamp_ms() == 1000);
    CHECK(id.rand_hi() == 0x0101);
    CHECK(id.rand_lo() == 0x0101010101010101ULL);
    CHECK(id.str() == "00000000Z8040G2081040G2081");
    CHECK(entropy->calls == 1);
}

TEST_CASE("Same millisecond increments the randomness by one", "[generator][monotonic]") {
    auto entropy = std::make_shared<CountingEntropy>();
    Generator gen(std::make_shared<FixedClock>(1234567890000ULL), entropy);

    std::vector<ULID> ids;
    for (int i = 0; i < 1000; ++i) ids.push_back(gen.next());

    CHECK(entropy->calls == 1);
    for (std::size_t i = 1; i < ids.size(); ++i) {
        CHECK(ids[i].timestamp_ms() == 1234567890000ULL);
        CHECK(ids[i - 1] < ids[i]);
        CHECK(ids[i - 1].str() < ids[i].str());
        CHECK(ids[i].rand_lo() == ids[i - 1].rand_lo() + 1);
    }
}

TEST_CASE("Increment carries into the high 16 bits", "[generator][monotonic]") {
    // 0xFF bytes except the last word's low byte: low = 0x...FFFE after the first draw
    class NearCarry final : public Entropy {
    public:
        void fill(uint8_t* out, std::size_t n) override {
            for (std::size_t i = 0; i < n; ++i) out[i] = 0x00;
            for (std::size_t i = 2; i < n; ++i) out[i] = 0xFF;
            out[n - 1] = 0xFE;
        }
    };
    Generator gen(std::make_shared<FixedClock>(5), std::make_shared<NearCarry>());

    ULID a = gen.next();
    ULID b = gen.next();
    ULID c = gen.next();
    CHECK(a.rand_hi() == 0);
    CHECK(a.rand_lo() == 0xFFFFFFFFFFFFFFFEULL);
    CHECK(b.rand_lo() == UINT64_MAX);
    CHECK(c.rand_hi() == 1);
    CHECK(c.rand_lo() == 0);
    CHECK(b < c);
}

TEST_CASE("Exhausted randomness fails instead of wrapping", "[generator][overflow]") {
    Generator gen(std::make_shared<FixedClock>(42), std::make_shared<CountingEntropy>(false, 0xFF));

    ULID last = gen.next();
    CHECK(last.str() == ULID(42, MAX_RAND_HI, UINT64_MAX).str());

    try {
        gen.next();
        FAIL("randomness wrapped");
    } catch (const UlidError& e) {
        CHECK(e.code() == UlidErrc::RandomnessOverflow);
    }
    // still exhausted: nothing was consumed by the failed call
    CHECK_THROWS_AS(gen.next(), UlidError);
}

TEST_CASE("A new millisecond draws new randomness", "[generator][clock]") {
    auto entropy = std::make_shared<CountingEntropy>();
    Generator gen(std::make_shared<StepClock>(1000), entropy);

    ULID a = gen.next();
    ULID b = gen.next();
    CHECK(a.timestamp_ms() == 1000);
    CHECK(b.timestamp_ms() == 1001);
    CHECK(a < b);
    CHECK(entropy->calls == 2);
    CHECK(a.rand_lo() == 0x0101010101010101ULL);
    CHECK(b.rand_lo() == 0x0202020202020202ULL);
}

TEST_CASE("Clock regression keeps the last timestamp in monotonic mode", "[generator][clock]") {
    auto entropy = std::make_shared<CountingEntropy>();
    Generator gen(std::make_shared<ScriptedClock>(std::vector<uint64_t> {2000, 1500, 1999, 2000, 2001}), entropy);

    std::vector<ULID> ids;
    for (int i = 0; i < 5; ++i) ids.push_back(gen.next());

    CHECK(ids[0].timestamp_ms() == 2000);
    CHECK(ids[1].timestamp_ms() == 2000);
    CHECK(ids[2].timestamp_ms() == 2000);
    CHECK(ids[3].timestamp_ms() == 2000);
    CHECK(ids[4].timestamp_ms() == 2001);
    for (std::size_t i = 1; i < ids.size(); ++i) CHECK(ids[i - 1] < ids[i]);
    CHECK(entropy->calls == 2);
}

TEST_CASE("Clock regression throws in strict mode", "[generator][clock]") {
    Generator gen(std::make_shared<ScriptedClock>(std::vector<uint64_t> {2000, 1990, 2000}),
                  std::make_shared<CountingEntropy>(), ClockPolicy::Strict);

    ULID first = gen.next();
    try {
        gen.next();
        FAIL("clock regression was accepted");
    } catch (const UlidError& e) {
        CHECK(e.code() == UlidErrc::ClockRegression);
        CHECK(std::string(e.what()).find("backward=10ms") != std::string::npos);
    }
    // same millisecond again is not a regression
    ULID third = gen.next();
    CHECK(third.timestamp_ms() == 2000);
    CHECK(first < third);
}

TEST_CASE("Clock beyond 48 bits is rejected", "[generator][error]") {
    Generator gen(std::make_shared<FixedClock>(MAX_TIMESTAMP + 1), std::make_shared<CountingEntropy>());
    try {
        gen.next();
        FAIL("timestamp above 2^48-1 was accepted");
    } catch (const UlidError& e) {
        CHECK(e.code() == UlidErrc::OutOfRange);
    }
}

TEST_CASE("Batch is strictly increasing and continues the sequence", "[generator][batch]") {
    auto clock = std::make_shared<FixedClock>(7000);
    Generator gen(clock, std::make_shared<CountingEntropy>());

    ULID before = gen.next();
    auto batch = gen.next_batch(1000);
    REQUIRE(batch.size() == 1000);
    CHECK(before < batch.front());
    for (std::size_t i = 1; i < batch.size(); ++i) CHECK(batch[i - 1] < batch[i]);

    clock->set(7001);
    ULID after = gen.next();
    CHECK(batch.back() < after);
    CHECK(after.timestamp_ms() == 7001);

    CHECK(gen.next_batch(0).empty());
}

TEST_CASE("Failed batch leaves the generator untouched", "[generator][batch][overflow]") {
    // randomness starts 2 below the maximum: one more ID fits, a batch of 3 does not
    class NearMax final : public Entropy {
    public:
        void fill(uint8_t* out, std::size_t n) override {
            for (std::size_t i = 0; i < n; ++i) out[i] = 0xFF;
            out[n - 1] = 0xFD;
        }
    };
    Generator gen(std::make_shared<FixedClock>(9), std::make_shared<NearMax>());

    ULID first = gen.next();
    CHECK_THROWS_AS(gen.next_batch(3), UlidError);

    auto two = gen.next_batch(2);
    REQUIRE(two.size() == 2);
    CHECK(two[0].rand_lo() == first.rand_lo() + 1);
    CHECK(two[1].rand_lo() == UINT64_MAX);
}

TEST_CASE("Shared generator stays unique and ordered across threads", "[generator][concurrency]") {
    Generator gen(std::make_shared<MonotonicClock>(), std::make_shared<SystemEntropy>());

    constexpr int threads = 8;
    constexpr int per_thread = 2000;
    std::vector<std::vector<ULID>> results(threads);
    std::vector<std::thread> pool;
    for (int t = 0; t < threads; ++t) {
        pool.emplace_back([&, t] {
            for (int i = 0; i < per_thread; ++i) results[t].push_back(gen.next());
        });
    }
    for (auto& th : pool) th.join();

    std::set<ULID> all;
    for (const auto& r : results) {
        // each thread sees its own calls in increasing order
        for (std::size_t i = 1; i < r.size(); ++i) CHECK(r[i - 1] < r[i]);
        all.insert(r.begin(), r.end());
    }
    CHECK(all.size() == static_cast<std::size_t>(threads * per_thread));
}

TEST_CASE("Real clock output is ordered across a millisecond tick", "[generator][clock]") {
    Generator gen;
    ULID a = gen.next();
    std::this_thread::sleep_for(3ms);
    ULID b = gen.next();
    CHECK(a.timestamp_ms() < b.timestamp_ms());
    CHECK(a.str() < b.str());
}

TEST_CASE("Monotonic clock never goes backwards", "[clock]") {
    MonotonicClock clock;
    uint64_t prev = clock.now_ms();
    SystemClock sys;
    CHECK(prev + 1000 > sys.now_ms());
    for (int i = 0; i < 1000; ++i) {
        uint64_t now = clock.now_ms();
        CHECK(now >= prev);
        prev = now;
    }
}

TEST_CASE("Monotonic clock anchors on its reference clock", "[clock]") {
    auto reference = std::make_shared<FixedClock>(1000);
    MonotonicClock clock(reference);

    CHECK(clock.now_ms() == 1000);
    // later reference readings are ignored once anchored
    reference->set(500);
    uint64_t prev = 1000;
    for (int i = 0; i < 100; ++i) {
        uint64_t now = clock.now_ms();
        CHECK(now >= prev);
        prev = now;
    }
    std::this_thread::sleep_for(5ms);
    CHECK(clock.now_ms() >= 1005);

    CHECK_THROWS_AS(MonotonicClock(nullptr), UlidError);
}

TEST_CASE("Clock policy names", "[generator][config]") {
    CHECK(clockpolicy("strict") == ClockPolicy::Strict);
    CHECK(clockpolicy("monotonic") == ClockPolicy::Monotonic);
    CHECK(clockpolicy(ClockPolicy::Strict) == "strict");
    CHECK_THROWS_AS(clockpolicy("lenient"), UlidError);
    CHECK_THROWS_AS(make_clock("ntp"), UlidError);
    CHECK(is_clock_name("monotonic"));
    CHECK_FALSE(is_clock_name("ntp"));
}
