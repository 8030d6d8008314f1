// ============================================================================
// cleaner.cpp — Whole-file cleaning
// ============================================================================
//
// The file is read exactly once.  Classification, transformation and the
// "did anything change" comparison all work on that single buffer.
//
// ============================================================================

#include "wsclean/cleaner.hpp"
#include "wsclean/classify.hpp"
#include "wsclean/transform.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace wsclean {

// ── split_lines ─────────────────────────────────────────────────────────────

std::vector<std::string> split_lines(std::string_view contents) {
    std::vector<std::string> lines;
    if (contents.empty()) return lines;

    // Drop the final newline; otherwise the split yields an extra "".
    if (contents.back() == '\n') {
        contents.remove_suffix(1);
    }

    std::size_t start = 0;
    while (true) {
        std::size_t nl = contents.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(contents.substr(start));
            break;
        }
        lines.emplace_back(contents.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

// ── join_lines ──────────────────────────────────────────────────────────────

std::string join_lines(const std::vector<std::string>& lines) {
    std::size_t size = 0;
    for (const auto& line : lines) size += line.size() + 1;

    std::string out;
    out.reserve(size);
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

// ── clean_text ──────────────────────────────────────────────────────────────

CleanResult clean_text(std::string_view contents, const Settings& settings,
                       const std::string& name) {
    CleanResult result;
    if (contents.empty()) return result;

    std::vector<std::string> lines = split_lines(contents);
    bool terminated = contents.back() == '\n';

    if (auto notice = apply_trailing_lines(lines, settings.trailing, terminated)) {
        if (!name.empty()) *notice += " in " + name;
        result.notices.push_back(std::move(*notice));
    }

    for (auto& line : lines) {
        std::string trimmed = trim_trailing(line);
        if (trimmed.size() < line.size()) {
            ++result.stats.trimmed;
        }

        std::string converted = convert_leading(trimmed, settings.tab_mode, settings.tab_size);
        if (converted.size() != trimmed.size()) {
            ++result.stats.tabs;
        }
        line = std::move(converted);
    }

    result.text = join_lines(lines);
    return result;
}

// ── status_to_string ────────────────────────────────────────────────────────

const char* status_to_string(FileStatus status) {
    switch (status) {
        case FileStatus::Cleaned:     return "cleaned";
        case FileStatus::NotRegular:  return "not a regular file";
        case FileStatus::Binary:      return "binary";
        case FileStatus::ReadFailed:  return "read failed";
        case FileStatus::WriteFailed: return "write failed";
    }
    return "unknown";
}

// ── is_regular ──────────────────────────────────────────────────────────────

bool is_regular(const std::string& path) {
    std::error_code ec;
    std::filesystem::file_status st = std::filesystem::status(path, ec);
    if (ec) return false;
    return std::filesystem::is_regular_file(st);
}

// ── clean_file ──────────────────────────────────────────────────────────────

FileReport clean_file(const std::string& path, const Settings& settings,
                      const FileIo& io) {
    FileReport report;
    report.path = path;

    if (!is_regular(path)) {
        report.status = FileStatus::NotRegular;
        return report;
    }

    std::string contents;
    try {
        contents = io.read(path);
    } catch (const std::runtime_error& e) {
        report.status = FileStatus::ReadFailed;
        report.error  = e.what();
        return report;
    }

    if (!is_text(contents)) {
        report.status = FileStatus::Binary;
        return report;
    }

    // Empty files stay empty.
    if (contents.empty()) return report;

    CleanResult result = clean_text(contents, settings, path);
    report.stats   = result.stats;
    report.notices = std::move(result.notices);
    report.changed = result.text != contents;

    if (!report.changed || settings.dry_run) return report;

    try {
        io.write(path, result.text);
    } catch (const std::runtime_error& e) {
        report.status = FileStatus::WriteFailed;
        report.error  = e.what();
        report.stats  = CleanStats{};
    }
    return report;
}

}  // namespace wsclean
