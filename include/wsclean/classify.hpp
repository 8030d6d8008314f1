// ============================================================================
// wsclean/classify.hpp — Text / binary detection
// ============================================================================
//
// A file is text when none of its first kSniffBytes bytes falls outside
// the range 0x09..0x7E.  That admits tab, LF, VT, FF, CR and printable
// ASCII; anything else (NUL and friends, DEL, high-bit bytes) marks the
// file as binary and it is never rewritten.
//
// ============================================================================

#ifndef WSCLEAN_CLASSIFY_HPP
#define WSCLEAN_CLASSIFY_HPP

#include <cstddef>
#include <string_view>

namespace wsclean {

/// Number of leading bytes inspected by is_text().
inline constexpr std::size_t kSniffBytes = 1024;

/// True if `byte` may appear in a text file.
constexpr bool is_text_byte(unsigned char byte) noexcept {
    return byte >= 0x09 && byte <= 0x7E;
}

/// Classify a buffer by its first kSniffBytes bytes.  Empty input is text.
bool is_text(std::string_view contents) noexcept;

}  // namespace wsclean

#endif  // WSCLEAN_CLASSIFY_HPP
