#include "tool.hpp"
#include <exception>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "ulid_json.hpp"
#include "verifier.hpp"

namespace ulidkit {

static void usage(std::ostream &err)
{
    err << "Usage: ulidkit [--config <file>] [--json] [--quiet] [--strict] [--monotonic-clock] "
           "(generate [count] | validate)" << std::endl;
}

static bool parse_count(const std::string &arg, uint64_t &count)
{
    if (arg.empty() || arg.find_first_not_of("0123456789") != std::string::npos)
        return false;
    try {
        count = std::stoull(arg);
    } catch (const std::out_of_range &) {
        return false;
    }
    return true;
}

int run(const std::vector<std::string> &args, std::istream &in, std::ostream &out, std::ostream &err)
{
    std::string config_path;
    std::string mode;
    std::string count_arg;
    bool json = false, quiet = false, strict = false, monotonic_clock = false;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        if (a == "--config")
        {
            if (++i >= args.size()) { usage(err); return 1; }
            config_path = args[i];
        }
        else if (a == "--json") json = true;
        else if (a == "--quiet") quiet = true;
        else if (a == "--strict") strict = true;
        else if (a == "--monotonic-clock") monotonic_clock = true;
        else if (mode.empty()) mode = a;
        else if (mode == "generate" && count_arg.empty()) count_arg = a;
        else { usage(err); return 1; }
    }

    if (mode != "generate" && mode != "validate")
    {
        if (!mode.empty()) err << "Unknown mode: " << mode << std::endl;
        usage(err);
        return 1;
    }

    try
    {
        Config cfg = config_path.empty() ? Config {} : Config::load_file(config_path);
        if (json) cfg.json_summary = true;
        if (quiet) cfg.quiet = true;
        if (strict) cfg.clock_policy = ClockPolicy::Strict;
        if (monotonic_clock) cfg.clock = "monotonic";
        if (!count_arg.empty() && !parse_count(count_arg, cfg.count))
        {
            err << "Invalid count: " << count_arg << std::endl;
            return 1;
        }

        Generator gen(make_clock(cfg.clock), std::make_shared<SystemEntropy>(), cfg.clock_policy);
        Verifier verifier(gen, err, VerifierOptions {cfg.log_skipped});

        if (mode == "generate")
        {
            if (!cfg.quiet)
                err << "[*] Generating " << cfg.count << " ULIDs (clock: " << cfg.clock
                    << ", policy: " << clockpolicy(cfg.clock_policy) << ")" << std::endl;
            verifier.generate(cfg.count, out);
            return 0;
        }

        if (!cfg.quiet)
            err << "[*] Validating ULIDs from stdin..." << std::endl;
        ValidateReport report = verifier.validate(in);

        if (cfg.json_summary)
            out << nlohmann::json(report).dump() << std::endl;
        else
            out << "Validation Results: " << report.valid << "/" << report.total << " valid" << std::endl;

        return report.passed() ? 0 : 1;
    }
    catch (const UlidError &e)
    {
        err << "[" << errc_name(e.code()) << "] " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        err << "[!] " << e.what() << std::endl;
        return 1;
    }
}

} // namespace ulidkit
