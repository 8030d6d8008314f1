// ============================================================================
// test.cpp — Self-test suite for the wsclean tool
// ============================================================================
//
// Contains tests covering:
//   - Text / binary classification (sniff window, byte ranges)
//   - Trailing trim (idempotence, which characters count)
//   - Leading tab expansion and space contraction, and their round trip
//   - Trailing-line policy (strip / ensure)
//   - Line splitting and joining
//   - Whole-buffer cleaning, including the documented scenarios
//   - File processing on a scratch directory (regular, binary, missing,
//     directory, empty, unchanged, dry run, I/O errors)
//   - Argument parsing and the driver's output
//
// ============================================================================

#include "wsclean/test.hpp"
#include "wsclean/classify.hpp"
#include "wsclean/cleaner.hpp"
#include "wsclean/cli.hpp"
#include "wsclean/report.hpp"
#include "wsclean/transform.hpp"
#include "wsclean/utils.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace wsclean {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: \"" << escape_whitespace(expected) << "\"\n"
                  << "    actual:   \"" << escape_whitespace(actual) << "\"\n";
    }
}

void TestContext::check_eq(long actual, long expected, const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

// Scratch directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    ScratchDir() {
        static int counter = 0;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("wsclean_test_" + std::to_string(stamp) + "_" + std::to_string(++counter));
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    std::string file(const std::string& name, const std::string& contents) const {
        std::string p = (path_ / name).string();
        write_file(p, contents);
        return p;
    }

    std::string path(const std::string& name) const { return (path_ / name).string(); }

    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

static Settings make_settings(TabMode mode, int tab_size = kDefaultTabSize,
                              TrailingLines trailing = TrailingLines::Keep) {
    Settings s;
    s.tab_mode = mode;
    s.tab_size = tab_size;
    s.trailing = trailing;
    return s;
}

static Options parse(const std::vector<std::string>& args) {
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.emplace_back("wsclean");
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(storage.size()), argv.data());
}

static bool parse_fails(const std::vector<std::string>& args) {
    try {
        parse(args);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

static std::string to_text(const std::vector<std::string>& lines) {
    std::string out = "[";
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += ", ";
        out += "\"" + escape_whitespace(lines[i]) + "\"";
    }
    return out + "]";
}

// ============================================================================
// Classifier
// ============================================================================

static void test_classify_basic(TestContext& ctx) {
    ctx.check(is_text(""), "empty buffer is text");
    ctx.check(is_text("hello\tworld\r\n"), "tab, CR, LF and printable ASCII are text");
    ctx.check(is_text("~ \x0b\x0c"), "tilde, space, VT and FF are text");
}

static void test_classify_binary_bytes(TestContext& ctx) {
    ctx.check(!is_text(std::string("abc\0def", 7)), "NUL is binary");
    ctx.check(!is_text("abc\x08"), "backspace (0x08) is binary");
    ctx.check(!is_text("abc\x7f"), "DEL (0x7F) is binary");
    ctx.check(!is_text("caf\xc3\xa9"), "UTF-8 multibyte is binary");
    ctx.check(!is_text("\xff"), "0xFF is binary");
    ctx.check(is_text_byte(0x09) && !is_text_byte(0x08), "lower bound is 0x09");
    ctx.check(is_text_byte(0x7E) && !is_text_byte(0x7F), "upper bound is 0x7E");
}

static void test_classify_sniff_window(TestContext& ctx) {
    std::string inside(kSniffBytes - 1, 'a');
    inside += '\x01';
    ctx.check(!is_text(inside), "bad byte at offset 1023 is seen");

    std::string outside(kSniffBytes, 'a');
    outside += '\x01';
    ctx.check(is_text(outside), "bad byte at offset 1024 is ignored");
}

// ============================================================================
// Trailing trim
// ============================================================================

static void test_trim_trailing(TestContext& ctx) {
    ctx.check_eq(trim_trailing("foo  "), "foo", "trailing spaces");
    ctx.check_eq(trim_trailing("foo\t\t"), "foo", "trailing tabs");
    ctx.check_eq(trim_trailing("foo \t \t"), "foo", "mixed trailing run");
    ctx.check_eq(trim_trailing("  foo"), "  foo", "leading whitespace kept");
    ctx.check_eq(trim_trailing("a  b "), "a  b", "inner whitespace kept");
    ctx.check_eq(trim_trailing(" \t "), "", "whitespace-only line becomes empty");
    ctx.check_eq(trim_trailing(""), "", "empty line");
    ctx.check_eq(trim_trailing("foo\r"), "foo\r", "CR is not trimmed");
}

static void test_trim_idempotent(TestContext& ctx) {
    const std::vector<std::string> samples = {
        "foo  ", "\tbar\t", "  ", "", "x \t y \t", "keep\r  ",
    };
    for (const auto& s : samples) {
        std::string once = trim_trailing(s);
        ctx.check_eq(trim_trailing(once), once, "idempotent: " + escape_whitespace(s));
    }
}

// ============================================================================
// Leading conversion
// ============================================================================

static void test_expand_leading_tabs(TestContext& ctx) {
    ctx.check_eq(expand_leading_tabs("\tx", 4), "    x", "one tab");
    ctx.check_eq(expand_leading_tabs("\t\tx", 4), "        x", "two tabs");
    ctx.check_eq(expand_leading_tabs("\tx", 8), "        x", "tab size 8");
    ctx.check_eq(expand_leading_tabs("\tx\ty", 4), "    x\ty", "mid-line tab untouched");
    ctx.check_eq(expand_leading_tabs(" \tx", 4), " \tx", "tab after space is not leading");
    ctx.check_eq(expand_leading_tabs("x", 4), "x", "no tabs");
    ctx.check_eq(expand_leading_tabs("", 4), "", "empty line");
    ctx.check_eq(expand_leading_tabs("\t", 2), "  ", "tab-only line");
}

static void test_contract_leading_spaces(TestContext& ctx) {
    ctx.check_eq(contract_leading_spaces("        x", 4), "\t\tx", "eight spaces at ts 4");
    ctx.check_eq(contract_leading_spaces("    x", 4), "\tx", "one full run");
    ctx.check_eq(contract_leading_spaces("      x", 4), "\t  x", "partial run left as spaces");
    ctx.check_eq(contract_leading_spaces("   x", 4), "   x", "short run untouched");
    ctx.check_eq(contract_leading_spaces("  ", 4), "  ", "shorter than tab size");
    ctx.check_eq(contract_leading_spaces("        x", 8), "\tx", "tab size 8");
    ctx.check_eq(contract_leading_spaces("x        y", 4), "x        y", "inner spaces untouched");
    ctx.check_eq(contract_leading_spaces("\t    x", 4), "\t    x", "existing tab stops the scan");
    ctx.check_eq(contract_leading_spaces("", 4), "", "empty line");
}

static void test_convert_leading_modes(TestContext& ctx) {
    ctx.check_eq(convert_leading("\t    x", TabMode::Keep, 4), "\t    x", "keep");
    ctx.check_eq(convert_leading("\tx", TabMode::Expand, 4), "    x", "expand");
    ctx.check_eq(convert_leading("    x", TabMode::Contract, 4), "\tx", "contract");
}

static void test_expand_contract_round_trip(TestContext& ctx) {
    const std::vector<std::string> lines = {
        "\tint x;", "\t\treturn  y;", "no indent", "\t\t\tdeep\tinner", "",
    };
    for (int ts : {2, 4, 8}) {
        for (const auto& line : lines) {
            std::string back = contract_leading_spaces(expand_leading_tabs(line, ts), ts);
            ctx.check_eq(back, line, "round trip ts=" + std::to_string(ts));
        }
    }
}

// ============================================================================
// Trailing-line policy
// ============================================================================

static void test_trailing_strip(TestContext& ctx) {
    std::vector<std::string> lines = {"a", "", "  ", ""};
    auto notice = apply_trailing_lines(lines, TrailingLines::Strip);
    ctx.check_eq(to_text(lines), to_text({"a"}), "blank tail removed");
    ctx.check(notice.has_value(), "notice emitted");
    if (notice) ctx.check_eq(*notice, "Stripped 3 trailing blank lines", "notice text");

    std::vector<std::string> one = {"a", ""};
    notice = apply_trailing_lines(one, TrailingLines::Strip);
    if (notice) ctx.check_eq(*notice, "Stripped 1 trailing blank line", "singular notice");
    ctx.check(notice.has_value(), "singular notice emitted");

    std::vector<std::string> clean = {"a", "b"};
    ctx.check(!apply_trailing_lines(clean, TrailingLines::Strip), "no blank tail → no notice");
    ctx.check_eq(to_text(clean), to_text({"a", "b"}), "lines unchanged");
}

static void test_trailing_ensure(TestContext& ctx) {
    std::vector<std::string> done = {"a", "b"};
    ctx.check(!apply_trailing_lines(done, TrailingLines::Ensure, true), "terminated file needs nothing");
    ctx.check_eq(to_text(done), to_text({"a", "b"}), "no line appended");

    std::vector<std::string> bare = {"a", "b"};
    auto notice = apply_trailing_lines(bare, TrailingLines::Ensure, false);
    ctx.check_eq(to_text(bare), to_text({"a", "b"}), "lines unchanged, the writer adds the newline");
    ctx.check(notice.has_value(), "missing newline reported");
    if (notice) ctx.check_eq(*notice, "Added trailing newline", "notice text");

    std::vector<std::string> extra = {"a", "", " \t"};
    notice = apply_trailing_lines(extra, TrailingLines::Ensure, true);
    ctx.check_eq(to_text(extra), to_text({"a"}), "blank tail collapsed");
    ctx.check(notice.has_value(), "collapse reported");
    if (notice) ctx.check_eq(*notice, "Collapsed 2 trailing blank lines", "collapse notice text");
}

static void test_trailing_keep_and_empty(TestContext& ctx) {
    std::vector<std::string> lines = {"a", "", ""};
    ctx.check(!apply_trailing_lines(lines, TrailingLines::Keep), "keep never changes");
    ctx.check_eq(static_cast<long>(lines.size()), 3, "keep leaves count");

    std::vector<std::string> none;
    ctx.check(!apply_trailing_lines(none, TrailingLines::Ensure), "empty sequence untouched (ensure)");
    ctx.check(!apply_trailing_lines(none, TrailingLines::Strip), "empty sequence untouched (strip)");
    ctx.check(none.empty(), "still empty");
}

// ============================================================================
// Split / join
// ============================================================================

static void test_split_lines(TestContext& ctx) {
    ctx.check_eq(to_text(split_lines("")), to_text({}), "empty");
    ctx.check_eq(to_text(split_lines("\n")), to_text({""}), "single newline");
    ctx.check_eq(to_text(split_lines("a")), to_text({"a"}), "no newline");
    ctx.check_eq(to_text(split_lines("a\n")), to_text({"a"}), "one trailing newline chomped");
    ctx.check_eq(to_text(split_lines("a\nb\n")), to_text({"a", "b"}), "two lines");
    ctx.check_eq(to_text(split_lines("a\n\n")), to_text({"a", ""}), "only one newline chomped");
    ctx.check_eq(to_text(split_lines("a\r\nb\r\n")), to_text({"a\r", "b\r"}), "CR kept");
}

static void test_join_lines(TestContext& ctx) {
    ctx.check_eq(join_lines({}), "", "no lines");
    ctx.check_eq(join_lines({""}), "\n", "one empty line");
    ctx.check_eq(join_lines({"a", "b"}), "a\nb\n", "final newline added");
}

// ============================================================================
// clean_text
// ============================================================================

static void test_clean_text_expand_scenario(TestContext& ctx) {
    auto r = clean_text("foo\t\t\n    bar\nbaz  \n", make_settings(TabMode::Expand, 4));
    ctx.check_eq(r.text, "foo\n    bar\nbaz\n", "output");
    ctx.check_eq(r.stats.trimmed, 2, "foo and baz lines trimmed");
    ctx.check_eq(r.stats.tabs, 0, "no leading tabs to expand");
}

static void test_clean_text_contract_scenario(TestContext& ctx) {
    auto r = clean_text("        x\n", make_settings(TabMode::Contract, 4));
    ctx.check_eq(r.text, "\t\tx\n", "output");
    ctx.check_eq(r.stats.tabs, 1, "one tab-adjusted line");
    ctx.check_eq(r.stats.trimmed, 0, "nothing trimmed");
}

static void test_clean_text_trim_before_expand(TestContext& ctx) {
    auto r = clean_text("\t\t\n\tx \n", make_settings(TabMode::Expand, 4));
    ctx.check_eq(r.text, "\n    x\n", "tab-only line trimmed to empty, not expanded");
    ctx.check_eq(r.stats.trimmed, 2, "both lines trimmed");
    ctx.check_eq(r.stats.tabs, 1, "only the content line expanded");
}

static void test_clean_text_clean_input(TestContext& ctx) {
    Settings s;
    auto r = clean_text("alpha\nbeta gamma\n", s);
    ctx.check_eq(r.text, "alpha\nbeta gamma\n", "unchanged");
    ctx.check_eq(r.stats.trimmed, 0, "no trims");
    ctx.check_eq(r.stats.tabs, 0, "no tabs");

    auto missing_nl = clean_text("alpha\nbeta", s);
    ctx.check_eq(missing_nl.text, "alpha\nbeta\n", "final newline normalised");
    ctx.check_eq(missing_nl.stats.trimmed, 0, "normalisation is not a trim");
}

static void test_clean_text_empty(TestContext& ctx) {
    auto r = clean_text("", make_settings(TabMode::Expand, 4, TrailingLines::Ensure));
    ctx.check_eq(r.text, "", "empty stays empty");
    ctx.check(r.notices.empty(), "no notices");
}

static void test_clean_text_trailing_policy(TestContext& ctx) {
    auto strip = clean_text("a\n\n  \n\n", make_settings(TabMode::Keep, 4, TrailingLines::Strip), "f.txt");
    ctx.check_eq(strip.text, "a\n", "trailing blanks stripped");
    ctx.check_eq(static_cast<long>(strip.notices.size()), 1, "one notice");
    if (!strip.notices.empty()) {
        ctx.check_eq(strip.notices[0], "Stripped 3 trailing blank lines in f.txt", "notice names file");
    }
    ctx.check_eq(strip.stats.trimmed, 0, "stripped lines are not counted as trims");

    Settings ensure_settings = make_settings(TabMode::Keep, 4, TrailingLines::Ensure);

    auto bare = clean_text("a", ensure_settings, "g.txt");
    ctx.check_eq(bare.text, "a\n", "single newline added");
    ctx.check_eq(static_cast<long>(bare.notices.size()), 1, "one notice");
    if (!bare.notices.empty()) {
        ctx.check_eq(bare.notices[0], "Added trailing newline in g.txt", "notice names file");
    }

    auto done = clean_text("a\n", ensure_settings, "g.txt");
    ctx.check_eq(done.text, "a\n", "single newline left alone");
    ctx.check(done.notices.empty(), "no notice when already terminated");

    auto two = clean_text("a\nb\n", ensure_settings);
    ctx.check_eq(two.text, "a\nb\n", "multi-line file left alone");
    ctx.check(two.notices.empty(), "no notice for multi-line file");

    auto many = clean_text("a\n\n\n", ensure_settings);
    ctx.check_eq(many.text, "a\n", "extra newlines collapsed to one");
    ctx.check_eq(static_cast<long>(many.notices.size()), 1, "collapse reported");
}

// ============================================================================
// Reporting
// ============================================================================

static void test_report_format(TestContext& ctx) {
    ctx.check_eq(pluralize("line", 0), "lines", "zero is plural");
    ctx.check_eq(pluralize("line", 1), "line", "one is singular");
    ctx.check_eq(pluralize("tab", 2), "tabs", "two is plural");

    ctx.check_eq(format_modifications({0, 0}, "a.txt"), "Fixed 0 lines in a.txt", "zero counts");
    ctx.check_eq(format_modifications({1, 0}, "a.txt"), "Fixed 1 line in a.txt", "singular line");
    ctx.check_eq(format_modifications({3, 1}, "a.txt"), "Fixed 3 lines and 1 tab in a.txt", "with tab");
    ctx.check_eq(format_modifications({0, 5}, ""), "Fixed 0 lines and 5 tabs", "summary has no file");
}

// ============================================================================
// File processing
// ============================================================================

static void test_clean_file_rewrites_text(TestContext& ctx) {
    ScratchDir dir;
    std::string p = dir.file("a.txt", "x  \n\ty\n");
    auto report = clean_file(p, make_settings(TabMode::Expand, 2));
    ctx.check(report.status == FileStatus::Cleaned, "status cleaned");
    ctx.check(report.changed, "changed");
    ctx.check_eq(report.stats.trimmed, 1, "one trim");
    ctx.check_eq(report.stats.tabs, 1, "one tab");
    ctx.check_eq(read_file(p), "x\n  y\n", "file rewritten");
}

static void test_clean_file_binary_untouched(TestContext& ctx) {
    ScratchDir dir;
    std::string original("abc  \n\x01\x02  \n", 11);
    std::string p = dir.file("b.bin", original);
    auto report = clean_file(p, make_settings(TabMode::Contract));
    ctx.check(report.status == FileStatus::Binary, "status binary");
    ctx.check_eq(read_file(p), original, "bytes unchanged");
    ctx.check_eq(report.stats.trimmed, 0, "no counts");
}

static void test_clean_file_not_regular(TestContext& ctx) {
    ScratchDir dir;
    auto missing = clean_file(dir.path("missing.txt"), Settings{});
    ctx.check(missing.status == FileStatus::NotRegular, "missing file");
    ctx.check(!is_regular(dir.path("missing.txt")), "is_regular false for missing");

    auto directory = clean_file(dir.str(), Settings{});
    ctx.check(directory.status == FileStatus::NotRegular, "directory");
    ctx.check(!is_regular(dir.str()), "is_regular false for directory");

    ctx.check_eq(std::string(status_to_string(FileStatus::NotRegular)), "not a regular file", "status name");
    ctx.check_eq(std::string(status_to_string(FileStatus::WriteFailed)), "write failed", "status name");
}

static void test_clean_file_empty_and_unchanged(TestContext& ctx) {
    ScratchDir dir;
    std::string empty = dir.file("empty.txt", "");
    auto r1 = clean_file(empty, make_settings(TabMode::Keep, 4, TrailingLines::Ensure));
    ctx.check(r1.status == FileStatus::Cleaned, "empty is text");
    ctx.check(!r1.changed, "empty not changed");
    ctx.check_eq(read_file(empty), "", "empty stays empty");

    int writes = 0;
    FileIo counting;
    counting.write = [&writes](const std::string& path, std::string_view text) {
        ++writes;
        write_file(path, text);
    };

    std::string clean = dir.file("clean.txt", "fine\n");
    auto r2 = clean_file(clean, Settings{}, counting);
    ctx.check(!r2.changed, "clean file not changed");
    ctx.check_eq(writes, 0, "clean file not written");
    ctx.check_eq(read_file(clean), "fine\n", "contents intact");

    std::string dirty = dir.file("dirty.txt", "fine \n");
    clean_file(dirty, Settings{}, counting);
    ctx.check_eq(writes, 1, "modified file written once");
}

static void test_clean_file_io_failures(TestContext& ctx) {
    ScratchDir dir;
    std::string p = dir.file("f.txt", "x  \n\ty\n");

    FileIo broken_write;
    broken_write.write = [](const std::string& path, std::string_view) {
        throw std::runtime_error("disk full: " + path);
    };
    auto w = clean_file(p, make_settings(TabMode::Expand), broken_write);
    ctx.check(w.status == FileStatus::WriteFailed, "write failure recorded");
    ctx.check_eq(w.error, "disk full: " + p, "write error kept");
    ctx.check_eq(w.stats.trimmed, 0, "counts zeroed on write failure");
    ctx.check_eq(w.stats.tabs, 0, "tab count zeroed on write failure");

    FileIo broken_read;
    broken_read.read = [](const std::string& path) -> std::string {
        throw std::runtime_error("cannot open file: " + path);
    };
    auto r = clean_file(p, Settings{}, broken_read);
    ctx.check(r.status == FileStatus::ReadFailed, "read failure recorded");
    ctx.check_eq(r.stats.trimmed, 0, "no counts on read failure");
    ctx.check_eq(read_file(p), "x  \n\ty\n", "file untouched");
}

static void test_clean_file_dry_run(TestContext& ctx) {
    ScratchDir dir;
    std::string p = dir.file("d.txt", "x  \n");
    Settings s;
    s.dry_run = true;
    auto report = clean_file(p, s);
    ctx.check(report.changed, "would change");
    ctx.check_eq(report.stats.trimmed, 1, "counted");
    ctx.check_eq(read_file(p), "x  \n", "file not written");
}

static void test_file_io_errors(TestContext& ctx) {
    ScratchDir dir;
    bool read_threw = false;
    try {
        read_file(dir.path("nope.txt"));
    } catch (const std::runtime_error&) {
        read_threw = true;
    }
    ctx.check(read_threw, "read_file throws on missing file");

    bool write_threw = false;
    try {
        write_file(dir.path("no/such/dir/out.txt"), "x");
    } catch (const std::runtime_error&) {
        write_threw = true;
    }
    ctx.check(write_threw, "write_file throws when the directory is missing");
}

// ============================================================================
// Argument parsing
// ============================================================================

static void test_parse_defaults(TestContext& ctx) {
    Options o = parse({"a.txt", "b.txt"});
    ctx.check(o.settings.tab_mode == TabMode::Keep, "keep by default");
    ctx.check_eq(o.settings.tab_size, kDefaultTabSize, "default tab size");
    ctx.check(o.settings.trailing == TrailingLines::Keep, "no trailing policy");
    ctx.check(!o.settings.dry_run, "not a dry run");
    ctx.check_eq(static_cast<long>(o.files.size()), 2, "two files");
}

static void test_parse_flags(TestContext& ctx) {
    Options e = parse({"-e", "-ts", "8", "f"});
    ctx.check(e.settings.tab_mode == TabMode::Expand, "-e");
    ctx.check_eq(e.settings.tab_size, 8, "-ts 8");

    Options c = parse({"--c", "-ts=2", "-t", "-n", "f"});
    ctx.check(c.settings.tab_mode == TabMode::Contract, "--c");
    ctx.check_eq(c.settings.tab_size, 2, "-ts=2");
    ctx.check(c.settings.trailing == TrailingLines::Strip, "-t");
    ctx.check(c.settings.dry_run, "-n");

    Options at = parse({"-at", "f"});
    ctx.check(at.settings.trailing == TrailingLines::Ensure, "-at");

    Options off = parse({"-e", "-e=false", "f"});
    ctx.check(off.settings.tab_mode == TabMode::Keep, "-e=false turns it off");

    ctx.check(parse({"-h"}).help, "-h");
    ctx.check(parse({"--help"}).help, "--help");
    ctx.check(parse({"--selftest"}).selftest, "--selftest");
}

static void test_parse_positional_stop(TestContext& ctx) {
    Options o = parse({"-e", "file", "-c"});
    ctx.check(o.settings.tab_mode == TabMode::Expand, "flags after a file are not parsed");
    ctx.check_eq(static_cast<long>(o.files.size()), 2, "later flag is a file");

    Options dd = parse({"--", "-e"});
    ctx.check(dd.settings.tab_mode == TabMode::Keep, "-- ends flags");
    ctx.check_eq(static_cast<long>(dd.files.size()), 1, "-e after -- is a file");
}

static void test_parse_errors(TestContext& ctx) {
    ctx.check(parse_fails({"-e", "-c", "f"}), "expand with contract");
    ctx.check(parse_fails({"-t", "-at", "f"}), "strip with ensure");
    ctx.check(parse_fails({"-x"}), "unknown flag");
    ctx.check(parse_fails({"-ts"}), "missing value");
    ctx.check(parse_fails({"-ts", "0"}), "zero tab size");
    ctx.check(parse_fails({"-ts", "2000000000"}), "huge tab size");
    ctx.check(parse_fails({"-ts", std::to_string(kMaxTabSize + 1)}), "just above the maximum");
    ctx.check(!parse_fails({"-ts", std::to_string(kMaxTabSize), "f"}), "maximum accepted");
    ctx.check(parse_fails({"-ts", "-3"}), "negative tab size");
    ctx.check(parse_fails({"-ts", "4x"}), "trailing junk");
    ctx.check(parse_fails({"-ts=abc"}), "not a number");
    ctx.check(parse_fails({"-e=maybe"}), "bad boolean");
    ctx.check(!parse_fails({"-h", "-e", "-c"}), "help wins over conflicts");
}

// ============================================================================
// Driver
// ============================================================================

static void test_run_no_files(TestContext& ctx) {
    std::ostringstream out, err;
    int rc = run(Options{}, out, err);
    ctx.check_eq(rc, 0, "exit code");
    ctx.check_eq(out.str(), "No files to work on.\n", "message");
}

static void test_run_report_lines(TestContext& ctx) {
    ScratchDir dir;
    std::string text   = dir.file("t.txt", "a \n\tb\n");
    std::string binary = dir.file("b.bin", std::string("\0\0", 2));
    std::string gone   = dir.path("gone.txt");

    Options opts;
    opts.settings = make_settings(TabMode::Expand, 4);
    opts.files = {text, binary, gone};

    std::ostringstream out, err;
    int rc = run(opts, out, err);
    ctx.check_eq(rc, 0, "exit code");

    std::string expected =
        "Fixed 1 line and 1 tab in " + text + "\n" +
        "Didn't clean binary file " + binary + "\n" +
        "Fixed 0 lines in " + binary + "\n" +
        "Couldn't clean " + gone + "\n" +
        "Fixed 0 lines in " + gone + "\n" +
        "Fixed 1 line and 1 tab\n";
    ctx.check_eq(out.str(), expected, "stdout");
    ctx.check_eq(err.str(), "", "no diagnostics");
    ctx.check_eq(read_file(text), "a\n    b\n", "text file cleaned");
}

static void test_run_totals_and_dry_run(TestContext& ctx) {
    ScratchDir dir;
    std::string a = dir.file("a.txt", "x \ny \n");
    std::string b = dir.file("b.txt", "z\t\n\n\n");

    Options opts;
    opts.settings.trailing = TrailingLines::Strip;
    opts.settings.dry_run  = true;
    opts.files = {a, b};

    std::ostringstream out, err;
    run(opts, out, err);

    std::string expected =
        "Fixed 2 lines in " + a + "\n" +
        "Stripped 2 trailing blank lines in " + b + "\n" +
        "Fixed 1 line in " + b + "\n" +
        "Fixed 3 lines\n" +
        "Dry run: no files were modified.\n";
    ctx.check_eq(out.str(), expected, "stdout");
    ctx.check_eq(read_file(b), "z\t\n\n\n", "dry run left file alone");
}

static void test_run_io_failure_not_fatal(TestContext& ctx) {
    ScratchDir dir;
    std::string bad  = dir.file("bad.txt", "a  \n");
    std::string good = dir.file("good.txt", "b \n");

    FileIo io;
    io.write = [&bad](const std::string& path, std::string_view text) {
        if (path == bad) throw std::runtime_error("error writing file: " + path);
        write_file(path, text);
    };

    Options opts;
    opts.files = {bad, good};

    std::ostringstream out, err;
    int rc = run(opts, out, err, io);
    ctx.check_eq(rc, 0, "exit code stays 0");
    ctx.check_eq(err.str(), "WARNING: write failed: error writing file: " + bad + "\n", "stderr");

    std::string expected =
        "Fixed 0 lines in " + bad + "\n" +
        "Fixed 1 line in " + good + "\n" +
        "Fixed 1 line\n";
    ctx.check_eq(out.str(), expected, "stdout");
    ctx.check_eq(read_file(good), "b\n", "later file still cleaned");
}

// ============================================================================
// Test Entry Point
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Classifier
    runner.run("classify_basic",                test_classify_basic);
    runner.run("classify_binary_bytes",         test_classify_binary_bytes);
    runner.run("classify_sniff_window",         test_classify_sniff_window);

    // Trailing trim
    runner.run("trim_trailing",                 test_trim_trailing);
    runner.run("trim_idempotent",               test_trim_idempotent);

    // Leading conversion
    runner.run("expand_leading_tabs",           test_expand_leading_tabs);
    runner.run("contract_leading_spaces",       test_contract_leading_spaces);
    runner.run("convert_leading_modes",         test_convert_leading_modes);
    runner.run("expand_contract_round_trip",    test_expand_contract_round_trip);

    // Trailing-line policy
    runner.run("trailing_strip",                test_trailing_strip);
    runner.run("trailing_ensure",               test_trailing_ensure);
    runner.run("trailing_keep_and_empty",       test_trailing_keep_and_empty);

    // Split / join
    runner.run("split_lines",                   test_split_lines);
    runner.run("join_lines",                    test_join_lines);

    // Whole-buffer cleaning
    runner.run("clean_text_expand_scenario",    test_clean_text_expand_scenario);
    runner.run("clean_text_contract_scenario",  test_clean_text_contract_scenario);
    runner.run("clean_text_trim_before_expand", test_clean_text_trim_before_expand);
    runner.run("clean_text_clean_input",        test_clean_text_clean_input);
    runner.run("clean_text_empty",              test_clean_text_empty);
    runner.run("clean_text_trailing_policy",    test_clean_text_trailing_policy);

    // Reporting
    runner.run("report_format",                 test_report_format);

    // File processing
    runner.run("clean_file_rewrites_text",      test_clean_file_rewrites_text);
    runner.run("clean_file_binary_untouched",   test_clean_file_binary_untouched);
    runner.run("clean_file_not_regular",        test_clean_file_not_regular);
    runner.run("clean_file_empty_and_unchanged", test_clean_file_empty_and_unchanged);
    runner.run("clean_file_dry_run",            test_clean_file_dry_run);
    runner.run("clean_file_io_failures",        test_clean_file_io_failures);
    runner.run("file_io_errors",                test_file_io_errors);

    // Argument parsing
    runner.run("parse_defaults",                test_parse_defaults);
    runner.run("parse_flags",                   test_parse_flags);
    runner.run("parse_positional_stop",         test_parse_positional_stop);
    runner.run("parse_errors",                  test_parse_errors);

    // Driver
    runner.run("run_no_files",                  test_run_no_files);
    runner.run("run_report_lines",              test_run_report_lines);
    runner.run("run_totals_and_dry_run",        test_run_totals_and_dry_run);
    runner.run("run_io_failure_not_fatal",      test_run_io_failure_not_fatal);

    return runner.summarise();
}

}  // namespace wsclean
