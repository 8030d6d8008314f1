// ============================================================================
// wsclean/report.hpp — Human-readable status lines
// ============================================================================

#ifndef WSCLEAN_REPORT_HPP
#define WSCLEAN_REPORT_HPP

#include "wsclean/cleaner.hpp"

#include <string>

namespace wsclean {

/// "line" for n == 1, "lines" otherwise.
std::string pluralize(const std::string& word, long n);

/// "Fixed 2 lines and 1 tab in foo.txt".  The tab clause is omitted when no
/// tabs were adjusted; the " in <path>" clause when `path` is empty.
std::string format_modifications(const CleanStats& stats, const std::string& path);

}  // namespace wsclean

#endif  // WSCLEAN_REPORT_HPP
