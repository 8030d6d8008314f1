// ============================================================================
// utils.cpp — File I/O and string utilities
// ============================================================================

#include "wsclean/utils.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace wsclean {

// ── read_file ───────────────────────────────────────────────────────────────

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::string contents((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("error reading file: " + path);
    }
    return contents;
}

// ── write_file ──────────────────────────────────────────────────────────────

void write_file(const std::string& path, std::string_view contents) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file for writing: " + path);
    }

    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file.close();
    if (file.fail()) {
        throw std::runtime_error("error writing file: " + path);
    }
}

// ── escape_whitespace ───────────────────────────────────────────────────────

std::string escape_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        auto uc = static_cast<unsigned char>(c);
        switch (c) {
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\\': out += "\\\\"; break;
            default:
                if (uc < 0x20 || uc > 0x7E) {
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(uc));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

}  // namespace wsclean
