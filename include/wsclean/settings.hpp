// ============================================================================
// wsclean/settings.hpp — Cleaning configuration
// ============================================================================
//
// Settings is built once from the command line and then passed by const
// reference to every transformation.  Nothing in the cleaner reads global
// state.
//
// ============================================================================

#ifndef WSCLEAN_SETTINGS_HPP
#define WSCLEAN_SETTINGS_HPP

#include <cstdint>

namespace wsclean {

// ── TabMode ─────────────────────────────────────────────────────────────────
// What to do with leading whitespace.  Expand and Contract are mutually
// exclusive, which the enum makes unrepresentable.

enum class TabMode : std::uint8_t {
    Keep,       // leave leading whitespace alone
    Expand,     // leading tabs → runs of tab_size spaces
    Contract,   // leading runs of tab_size spaces → tabs
};

// ── TrailingLines ───────────────────────────────────────────────────────────
// Policy for blank lines at the end of the file.

enum class TrailingLines : std::uint8_t {
    Keep,       // leave the line count alone
    Strip,      // drop every trailing blank line
    Ensure,     // end the file with exactly one newline
};

inline constexpr int kDefaultTabSize = 4;
inline constexpr int kMaxTabSize     = 64;

// ── Settings ────────────────────────────────────────────────────────────────

struct Settings {
    TabMode       tab_mode = TabMode::Keep;
    int           tab_size = kDefaultTabSize;   // 1 ..= kMaxTabSize
    TrailingLines trailing = TrailingLines::Keep;
    bool          dry_run  = false;             // report only, never write
};

}  // namespace wsclean

#endif  // WSCLEAN_SETTINGS_HPP
