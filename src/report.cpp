// ============================================================================
// report.cpp — Human-readable status lines
// ============================================================================

#include "wsclean/report.hpp"

#include <sstream>

namespace wsclean {

std::string pluralize(const std::string& word, long n) {
    if (n == 1) return word;
    return word + "s";
}

std::string format_modifications(const CleanStats& stats, const std::string& path) {
    std::ostringstream oss;
    oss << "Fixed " << stats.trimmed << " " << pluralize("line", stats.trimmed);
    if (stats.tabs > 0) {
        oss << " and " << stats.tabs << " " << pluralize("tab", stats.tabs);
    }
    if (!path.empty()) {
        oss << " in " << path;
    }
    return oss.str();
}

}  // namespace wsclean
