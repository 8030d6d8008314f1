// ============================================================================
// wsclean/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver loop: for each path → clean_file → per-file report, followed by
// an aggregate summary line.
//
// ============================================================================

#ifndef WSCLEAN_CLI_HPP
#define WSCLEAN_CLI_HPP

#include "wsclean/cleaner.hpp"
#include "wsclean/settings.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace wsclean {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    Settings                 settings;
    std::vector<std::string> files;     // paths to clean in place
    bool                     help = false;
    bool                     selftest = false;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage,
/// including conflicting flags (-e with -c, -t with -at).
///
/// Flags use a single dash as in "-ts 8"; "--ts", "-ts=8" and "--ts=8" are
/// accepted too.  Parsing stops at the first non-flag argument or at "--".
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver: clean every file and print the reports.
/// Returns the process exit code (always 0 once files are processed;
/// per-file failures are reported, not fatal).
int run(const Options& opts);

/// Same as run(opts), writing results to `out` and diagnostics to `err`
/// and doing file I/O through `io`.
int run(const Options& opts, std::ostream& out, std::ostream& err,
        const FileIo& io = {});

}  // namespace wsclean

#endif  // WSCLEAN_CLI_HPP
