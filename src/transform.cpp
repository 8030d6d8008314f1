// ============================================================================
// transform.cpp — Per-line whitespace transformations
// ============================================================================

#include "wsclean/transform.hpp"

#include <cstddef>

namespace wsclean {

// ── trim_trailing ───────────────────────────────────────────────────────────

std::string trim_trailing(std::string_view line) {
    auto end = line.find_last_not_of(" \t");
    if (end == std::string_view::npos) return "";
    return std::string(line.substr(0, end + 1));
}

// ── expand_leading_tabs ─────────────────────────────────────────────────────

std::string expand_leading_tabs(std::string_view line, int tab_size) {
    std::size_t leading = line.find_first_not_of('\t');
    if (leading == std::string_view::npos) leading = line.size();
    if (leading == 0) return std::string(line);

    std::string result;
    result.reserve(leading * static_cast<std::size_t>(tab_size) + (line.size() - leading));
    result.append(leading * static_cast<std::size_t>(tab_size), ' ');
    result.append(line.substr(leading));
    return result;
}

// ── contract_leading_spaces ─────────────────────────────────────────────────
// Each iteration consumes one full run of `tab_size` spaces.  The loop ends
// at the first position where fewer than `tab_size` characters remain or
// the next `tab_size` characters are not all spaces.

std::string contract_leading_spaces(std::string_view line, int tab_size) {
    const std::size_t width = static_cast<std::size_t>(tab_size);

    std::size_t pos   = 0;
    std::size_t runs  = 0;
    while (line.size() - pos >= width &&
           line.substr(pos, width).find_first_not_of(' ') == std::string_view::npos) {
        pos += width;
        ++runs;
    }
    if (runs == 0) return std::string(line);

    std::string result;
    result.reserve(runs + (line.size() - pos));
    result.append(runs, '\t');
    result.append(line.substr(pos));
    return result;
}

// ── convert_leading ─────────────────────────────────────────────────────────

std::string convert_leading(std::string_view line, TabMode mode, int tab_size) {
    switch (mode) {
        case TabMode::Expand:   return expand_leading_tabs(line, tab_size);
        case TabMode::Contract: return contract_leading_spaces(line, tab_size);
        case TabMode::Keep:     break;
    }
    return std::string(line);
}

// ── Trailing-line policy ────────────────────────────────────────────────────

bool is_blank(std::string_view line) noexcept {
    return line.find_first_not_of(" \t") == std::string_view::npos;
}

// Removes trailing blank lines; returns how many were dropped.
static std::size_t drop_blank_tail(std::vector<std::string>& lines) {
    std::size_t before = lines.size();
    while (!lines.empty() && is_blank(lines.back())) {
        lines.pop_back();
    }
    return before - lines.size();
}

std::optional<std::string> apply_trailing_lines(std::vector<std::string>& lines,
                                                TrailingLines policy,
                                                bool terminated) {
    if (lines.empty()) return std::nullopt;

    switch (policy) {
        case TrailingLines::Strip: {
            std::size_t removed = drop_blank_tail(lines);
            if (removed == 0) return std::nullopt;
            return "Stripped " + std::to_string(removed) + " trailing blank " +
                   (removed == 1 ? "line" : "lines");
        }
        case TrailingLines::Ensure: {
            // The writer terminates the last line, so a file ends in exactly
            // one '\n' once the blank tail is gone.
            std::size_t removed = drop_blank_tail(lines);
            if (removed > 0) {
                return "Collapsed " + std::to_string(removed) + " trailing blank " +
                       (removed == 1 ? "line" : "lines");
            }
            if (!terminated) return std::string("Added trailing newline");
            return std::nullopt;
        }
        case TrailingLines::Keep:
            break;
    }
    return std::nullopt;
}

}  // namespace wsclean
