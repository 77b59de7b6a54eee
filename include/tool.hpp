#pragma once
#include <iosfwd>
#include <string>
#include <vector>

namespace ulidkit {

/**
 * The ulidkit command line, minus argv[0]:
 *   [--config <file>] [--json] [--quiet] [--strict] [--monotonic-clock]
 *   (generate [count] | validate)
 *
 * IDs and the validate summary go to 'out', banners and diagnostics to 'err'.
 * Returns the process exit status: 0 on success, 1 on usage, config or
 * generator errors, and 1 from validate unless at least one ID was attempted
 * and all of them decoded.
 */
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace ulidkit
