#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "clock.hpp"
#include "generator.hpp"
#include "jsonhlp.hpp"

/****************** CONFIG KEYS */
#define CFG_COUNT        "count"
#define CFG_CLOCK        "clock"
#define CFG_CLOCK_POLICY "clock_policy"
#define CFG_LOG_SKIPPED  "log_skipped"
#define CFG_JSON_SUMMARY "json_summary"
#define CFG_QUIET        "quiet"

namespace ulidkit {

// Tool settings. Built from defaults, then a JSON file, then the command line.
struct Config {
    uint64_t    count        = 10;          // IDs emitted by 'generate' without an explicit count
    std::string clock        = "system";    // "system" | "monotonic"
    ClockPolicy clock_policy = ClockPolicy::Monotonic;
    bool        log_skipped  = false;       // echo wrong-length lines while validating
    bool        json_summary = false;       // validate summary as JSON
    bool        quiet        = false;       // no banners

    // Overlays the keys present in 'doc' on top of 'cfg'.
    // Throws UlidError(Config) for a non-object root, wrong value types or unknown names;
    // 'cfg' is only written when the whole document is accepted.
    static void from_json(const jval& doc, Config& cfg);

    static Config load_str(const std::string& js);
    static Config load_file(const std::string& path);
};

} // namespace ulidkit
