// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "wsclean/cli.hpp"
#include "wsclean/cleaner.hpp"
#include "wsclean/report.hpp"
#include "wsclean/test.hpp"

#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace wsclean {

// ── Flag value helpers ──────────────────────────────────────────────────────

namespace {

// Boolean flags may carry an explicit value ("-e=false").
bool parse_bool_value(const std::string& flag, const std::optional<std::string>& value) {
    if (!value) return true;
    const std::string& v = *value;
    if (v == "1" || v == "t" || v == "T" || v == "true" || v == "TRUE" || v == "True") {
        return true;
    }
    if (v == "0" || v == "f" || v == "F" || v == "false" || v == "FALSE" || v == "False") {
        return false;
    }
    throw std::runtime_error("invalid boolean value \"" + v + "\" for flag -" + flag);
}

int parse_tab_size(const std::string& text) {
    int n = 0;
    std::size_t used = 0;
    try {
        n = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid value \"" + text + "\" for flag -ts");
    }
    if (used != text.size()) {
        throw std::runtime_error("invalid value \"" + text + "\" for flag -ts");
    }
    if (n < 1 || n > kMaxTabSize) {
        throw std::runtime_error("-ts must be between 1 and " + std::to_string(kMaxTabSize));
    }
    return n;
}

}  // namespace

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;
    bool expand   = false;
    bool contract = false;
    bool strip    = false;
    bool ensure   = false;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--") {
            ++i;
            break;
        }
        // First positional argument ends the flags.  A lone "-" is a path.
        if (!arg.starts_with("-") || arg == "-") {
            break;
        }

        std::string name = arg.substr(arg.starts_with("--") ? 2 : 1);
        std::optional<std::string> value;
        if (auto eq = name.find('='); eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.resize(eq);
        }

        if (name == "e") {
            expand = parse_bool_value(name, value);
        } else if (name == "c") {
            contract = parse_bool_value(name, value);
        } else if (name == "t") {
            strip = parse_bool_value(name, value);
        } else if (name == "at") {
            ensure = parse_bool_value(name, value);
        } else if (name == "n") {
            opts.settings.dry_run = parse_bool_value(name, value);
        } else if (name == "h" || name == "help") {
            opts.help = parse_bool_value(name, value);
        } else if (name == "selftest") {
            opts.selftest = parse_bool_value(name, value);
        } else if (name == "ts") {
            if (!value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("flag needs an argument: -ts");
                }
                value = argv[++i];
            }
            opts.settings.tab_size = parse_tab_size(*value);
        } else {
            throw std::runtime_error("unknown option: " + arg);
        }
    }

    for (; i < argc; ++i) {
        opts.files.emplace_back(argv[i]);
    }

    if (opts.help) {
        return opts;
    }

    if (expand && contract) {
        throw std::runtime_error("Can't contract and expand tabs.");
    }
    if (strip && ensure) {
        throw std::runtime_error("Can't strip and add trailing newlines.");
    }

    if (expand)   opts.settings.tab_mode = TabMode::Expand;
    if (contract) opts.settings.tab_mode = TabMode::Contract;
    if (strip)    opts.settings.trailing = TrailingLines::Strip;
    if (ensure)   opts.settings.trailing = TrailingLines::Ensure;

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS] <file>...\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Trim trailing whitespace and convert indentation, in place.\n"
        << "\n"
        << "Options:\n"
        << "  -e            Expand leading tabs into spaces\n"
        << "  -c            Contract leading spaces into tabs\n"
        << "  -ts N         Size of tabs (default " << kDefaultTabSize << ")\n"
        << "  -t            Strip trailing blank lines\n"
        << "  -at           Ensure a single trailing newline\n"
        << "  -n            Dry run: report what would change, write nothing\n"
        << "  --selftest    Run built-in tests\n"
        << "  -h, --help    Show this message\n"
        << "\n"
        << "Options end at the first file name or at \"--\".  Binary files\n"
        << "and anything that is not a regular file are left untouched.\n";
}

// ── run ─────────────────────────────────────────────────────────────────────
// Main driver loop.  Cleans each file in turn and prints one status line
// per file followed by the totals.

int run(const Options& opts) {
    return run(opts, std::cout, std::cerr);
}

int run(const Options& opts, std::ostream& out, std::ostream& err,
        const FileIo& io) {
    // ── Handle --selftest ───────────────────────────────────────────────
    if (opts.selftest) {
        return run_selftests();
    }

    if (opts.files.empty()) {
        out << "No files to work on.\n";
        return 0;
    }

    // ── Process each file ───────────────────────────────────────────────
    CleanStats totals;

    for (const auto& path : opts.files) {
        FileReport report = clean_file(path, opts.settings, io);

        switch (report.status) {
            case FileStatus::NotRegular:
                out << "Couldn't clean " << path << "\n";
                break;
            case FileStatus::Binary:
                out << "Didn't clean binary file " << path << "\n";
                break;
            case FileStatus::ReadFailed:
            case FileStatus::WriteFailed:
                err << "WARNING: " << status_to_string(report.status) << ": "
                    << report.error << "\n";
                break;
            case FileStatus::Cleaned:
                break;
        }

        for (const auto& notice : report.notices) {
            out << notice << "\n";
        }
        out << format_modifications(report.stats, path) << "\n";
        totals += report.stats;
    }

    out << format_modifications(totals, "") << "\n";
    if (opts.settings.dry_run) {
        out << "Dry run: no files were modified.\n";
    }
    return 0;
}

}  // namespace wsclean
