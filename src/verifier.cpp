#include "verifier.hpp"
#include <algorithm>
#include <istream>
#include <ostream>
#include <string>

namespace ulidkit {

namespace {
    // IDs per next_batch() call when streaming
    constexpr std::size_t GENERATE_CHUNK = 1024;
}

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

Verifier::Verifier(Generator& generator, std::ostream& diag, VerifierOptions opts)
    : generator_(generator), diag_(diag), opts_(opts) { }

std::vector<std::string> Verifier::generate(std::size_t count) {
    std::vector<std::string> out;
    out.reserve(count);
    for (const ULID& id : generator_.next_batch(count)) {
        out.push_back(id.str());
    }
    return out;
}

std::size_t Verifier::generate(std::size_t count, std::ostream& out) {
    std::size_t written = 0;
    while (written < count) {
        std::size_t n = std::min(GENERATE_CHUNK, count - written);
        for (const ULID& id : generator_.next_batch(n)) {
            out << id.str() << '\n';
        }
        written += n;
    }
    out.flush();
    return written;
}

void Verifier::check_line(std::string_view line, ValidateReport& report) {
    std::string_view s = trim(line);
    if (s.empty()) return;

    // Ignore non-ULID lines (e.g. logs)
    if (s.size() != ULID_LENGTH) {
        ++report.skipped;
        if (opts_.log_skipped) diag_ << "  skipped: " << s << std::endl;
        return;
    }

    ++report.total;
    DecodeResult r = ULID::try_decode(s);
    if (r.ok) {
        ++report.valid;
    } else {
        diag_ << "  " << s << " -> Invalid: " << errc_name(r.error) << ": " << r.message << std::endl;
    }
}

ValidateReport Verifier::validate(std::istream& in) {
    ValidateReport report;
    std::string line;
    while (std::getline(in, line)) {
        check_line(line, report);
    }
    return report;
}

ValidateReport Verifier::validate(const std::vector<std::string>& lines) {
    ValidateReport report;
    for (const auto& line : lines) {
        check_line(line, report);
    }
    return report;
}

} // namespace ulidkit
