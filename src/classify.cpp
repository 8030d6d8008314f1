// ============================================================================
// classify.cpp — Text / binary detection
// ============================================================================

#include "wsclean/classify.hpp"

#include <algorithm>

namespace wsclean {

bool is_text(std::string_view contents) noexcept {
    std::string_view head = contents.substr(0, std::min(contents.size(), kSniffBytes));
    return std::all_of(head.begin(), head.end(), [](char c) {
        return is_text_byte(static_cast<unsigned char>(c));
    });
}

}  // namespace wsclean
