// ============================================================================
// wsclean/transform.hpp — Per-line whitespace transformations
// ============================================================================
//
// The cleaning pipeline applies, in this order:
//
//   1. Trailing-line policy  — strip trailing blank lines, or ensure the
//                              file ends in a single newline.
//   2. Trailing trim         — drop spaces and tabs at the end of a line.
//   3. Leading conversion    — expand leading tabs, or contract leading
//                              space runs, depending on the TabMode.
//
// Steps 2 and 3 are pure functions on a single line.  Callers compare the
// line length before and after to decide whether a line was "trimmed" or
// "tab-adjusted".
//
// ============================================================================

#ifndef WSCLEAN_TRANSFORM_HPP
#define WSCLEAN_TRANSFORM_HPP

#include "wsclean/settings.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wsclean {

// ── Trailing trim ───────────────────────────────────────────────────────────

/// Remove trailing spaces and tabs.  Other whitespace (CR, VT, FF) is kept.
std::string trim_trailing(std::string_view line);

// ── Leading conversion ──────────────────────────────────────────────────────
//
// Expand:    every tab before the first non-tab character becomes
//            `tab_size` spaces.  Tabs after that point are copied as-is.
//
// Contract:  leading runs of exactly `tab_size` spaces are removed one at a
//            time and replaced by the same number of tabs at the start of
//            the line.  A shorter remainder of spaces stays in place.
//
// `tab_size` must be >= 1.

std::string expand_leading_tabs(std::string_view line, int tab_size);

std::string contract_leading_spaces(std::string_view line, int tab_size);

/// Apply the conversion selected by `mode`.  TabMode::Keep returns the
/// line unchanged.
std::string convert_leading(std::string_view line, TabMode mode, int tab_size);

// ── Trailing-line policy ────────────────────────────────────────────────────

/// True if the line is empty or holds only spaces and tabs.
bool is_blank(std::string_view line) noexcept;

/// Apply `policy` to the line sequence in place.  Both policies look at
/// blankness (is_blank), not emptiness, since the policy runs before the
/// trailing trim.
///
/// Strip:   drop every trailing blank line.
/// Ensure:  leave the file ending in exactly one '\n'.  Trailing blank
///          lines are collapsed; `terminated` tells whether the input
///          already ended in '\n', so a missing one can be reported.
///
/// Returns a one-line notice describing the change, or std::nullopt if the
/// file needs none.  An empty sequence is never modified.
std::optional<std::string> apply_trailing_lines(std::vector<std::string>& lines,
                                                TrailingLines policy,
                                                bool terminated = true);

}  // namespace wsclean

#endif  // WSCLEAN_TRANSFORM_HPP
