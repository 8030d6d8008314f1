// ============================================================================
// wsclean/utils.hpp — Utility functions
// ============================================================================

#ifndef WSCLEAN_UTILS_HPP
#define WSCLEAN_UTILS_HPP

#include <string>
#include <string_view>

namespace wsclean {

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a whole file in binary mode.
/// Throws std::runtime_error if the file cannot be opened or read.
std::string read_file(const std::string& path);

/// Truncate `path` and write `contents` to it.  A new file is created with
/// the default mode (0666 minus umask); an existing one keeps its mode.
/// Throws std::runtime_error on failure, possibly after a partial write.
void write_file(const std::string& path, std::string_view contents);

// ── String helpers ──────────────────────────────────────────────────────────

/// Render tabs, newlines and other control bytes visibly ("\t", "\n",
/// "\x01") for diagnostics.
std::string escape_whitespace(std::string_view s);

}  // namespace wsclean

#endif  // WSCLEAN_UTILS_HPP
