#include "config.hpp"
#include "lib.hpp"

namespace ulidkit {

namespace {

    template <typename T>
    void require_type(const jval& doc, const char* key, const char* expected) {
        if (jhlp::wrong_type<T>(doc, key)) {
            ULIDKIT_THROW(UlidErrc::Config, "config key '%s' must be %s, got %s",
                          key, expected, jhlp::dump(doc[key]).c_str());
        }
    }

} // namespace

void Config::from_json(const jval& doc, Config& cfg) {
    if (!doc.IsObject()) {
        ULIDKIT_THROW(UlidErrc::Config, "config root must be a JSON object, got %s", jhlp::dump(doc).c_str());
    }

    require_type<uint64_t>   (doc, CFG_COUNT,        "an unsigned integer");
    require_type<std::string>(doc, CFG_CLOCK,        "a string");
    require_type<std::string>(doc, CFG_CLOCK_POLICY, "a string");
    require_type<bool>       (doc, CFG_LOG_SKIPPED,  "a boolean");
    require_type<bool>       (doc, CFG_JSON_SUMMARY, "a boolean");
    require_type<bool>       (doc, CFG_QUIET,        "a boolean");

    Config out = cfg;
    out.count        = jhlp::get<uint64_t>(doc, CFG_COUNT, out.count);
    out.clock        = jhlp::get<std::string>(doc, CFG_CLOCK, out.clock);
    out.log_skipped  = jhlp::get<bool>(doc, CFG_LOG_SKIPPED, out.log_skipped);
    out.json_summary = jhlp::get<bool>(doc, CFG_JSON_SUMMARY, out.json_summary);
    out.quiet        = jhlp::get<bool>(doc, CFG_QUIET, out.quiet);
    if (doc.HasMember(CFG_CLOCK_POLICY)) {
        out.clock_policy = clockpolicy(jhlp::get<std::string>(doc, CFG_CLOCK_POLICY));
    }

    if (!is_clock_name(out.clock)) {
        ULIDKIT_THROW(UlidErrc::Config, "unknown clock '%s' (expected system or monotonic)", out.clock.c_str());
    }
    cfg = out;
}

Config Config::load_str(const std::string& js) {
    jdoc doc;
    if (!jhlp::parse_str(js, doc)) {
        ULIDKIT_THROW(UlidErrc::Config, "config is not valid JSON");
    }
    Config cfg;
    from_json(doc, cfg);
    return cfg;
}

Config Config::load_file(const std::string& path) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) {
        ULIDKIT_THROW(UlidErrc::Config, "cannot load config file '%s'", path.c_str());
    }
    Config cfg;
    from_json(doc, cfg);
    return cfg;
}

} // namespace ulidkit
