#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include "generator.hpp"

namespace ulidkit {

struct ValidateReport {
    std::size_t valid   { 0 }; // 26-char lines that decoded
    std::size_t total   { 0 }; // 26-char lines attempted
    std::size_t skipped { 0 }; // non-empty lines of any other length

    bool passed() const { return total > 0 && valid == total; }
};

struct VerifierOptions {
    bool log_skipped = false; // echo wrong-length lines to the diagnostic stream
};

/**
 * Verifier
 *  - generate: a batch of canonical ULIDs from one generator, in increasing order
 *  - validate: one pass over a line stream, decoding every 26-char line
 *
 * Notes:
 *  - lines are trimmed; empty lines are ignored
 *  - lines of another length are counted in 'skipped', never in 'total'
 *  - a failed decode is reported to 'diag' and the stream continues
 */
class Verifier {
public:
    explicit Verifier(Generator& generator, std::ostream& diag, VerifierOptions opts = {});

    std::vector<std::string> generate(std::size_t count);

    // Writes one ULID per line to 'out'; returns how many were written.
    std::size_t generate(std::size_t count, std::ostream& out);

    ValidateReport validate(std::istream& in);
    ValidateReport validate(const std::vector<std::string>& lines);

    // Classifies one raw line and updates 'report'.
    void check_line(std::string_view line, ValidateReport& report);

private:
    Generator& generator_;
    std::ostream& diag_;
    VerifierOptions opts_;
};

std::string_view trim(std::string_view s);

} // namespace ulidkit
