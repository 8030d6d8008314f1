// ============================================================================
// wsclean/cleaner.hpp — Whole-file cleaning
// ============================================================================
//
// clean_text() runs the in-memory pipeline over a complete buffer:
//
//   chomp one trailing '\n' → split on '\n' → trailing-line policy
//   → trim → leading conversion → join with '\n' + final '\n'
//
// clean_file() wraps it with the filesystem side: regular-file check,
// single read, text/binary classification and the write-back.
//
// ============================================================================

#ifndef WSCLEAN_CLEANER_HPP
#define WSCLEAN_CLEANER_HPP

#include "wsclean/settings.hpp"
#include "wsclean/utils.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace wsclean {

// ── Counters ────────────────────────────────────────────────────────────────

struct CleanStats {
    long trimmed = 0;   // lines that lost trailing whitespace
    long tabs    = 0;   // lines whose leading whitespace was converted

    CleanStats& operator+=(const CleanStats& other) noexcept {
        trimmed += other.trimmed;
        tabs    += other.tabs;
        return *this;
    }
};

// ── Line sequence ───────────────────────────────────────────────────────────

/// Split on '\n' after removing a single trailing '\n'.
/// "a\nb\n" → {"a", "b"};  "a\n\n" → {"a", ""};  "" → {}.
std::vector<std::string> split_lines(std::string_view contents);

/// Join with '\n' and terminate the last line.  {} → "".
std::string join_lines(const std::vector<std::string>& lines);

// ── In-memory cleaning ──────────────────────────────────────────────────────

struct CleanResult {
    std::string              text;      // new file contents
    CleanStats               stats;
    std::vector<std::string> notices;   // trailing-line policy messages
};

/// Clean a text buffer.  An empty buffer yields an empty result with zero
/// counts.  Notices are phrased against `name`.
CleanResult clean_text(std::string_view contents, const Settings& settings,
                       const std::string& name = {});

// ── File processing ─────────────────────────────────────────────────────────

enum class FileStatus : std::uint8_t {
    Cleaned,        // text file processed (and written unless dry run)
    NotRegular,     // missing, unstattable, directory, device, ...
    Binary,         // classifier rejected the contents
    ReadFailed,
    WriteFailed,
};

const char* status_to_string(FileStatus status);

struct FileReport {
    std::string              path;
    FileStatus               status = FileStatus::Cleaned;
    CleanStats               stats;
    std::vector<std::string> notices;
    std::string              error;     // set for ReadFailed / WriteFailed
    bool                     changed = false;   // output differs from input
};

/// True if `path` names a regular file (symlinks followed).  Any error
/// while querying the filesystem yields false.
bool is_regular(const std::string& path);

/// The reads and writes clean_file() performs.  Both report failure by
/// throwing std::runtime_error.
struct FileIo {
    std::function<std::string(const std::string&)>             read  = read_file;
    std::function<void(const std::string&, std::string_view)>  write = write_file;
};

/// Clean one file in place.  Never throws for I/O problems; they are
/// recorded in the returned report.  A file whose cleaned text equals its
/// contents is not written.
FileReport clean_file(const std::string& path, const Settings& settings,
                      const FileIo& io = {});

}  // namespace wsclean

#endif  // WSCLEAN_CLEANER_HPP
