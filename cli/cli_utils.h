#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace xpratt::cli {

/// Maps a byte offset to 1-based line/column values for error messages.
/// Offsets past the end clamp to the last position.
std::pair<size_t, size_t> line_col_from_offset(const std::string& text, size_t offset);
/// Reads all of stdin; returns an empty string when nothing is piped.
std::string read_stdin();
bool stdin_is_terminal();
/// Checks UTF-8 well-formedness (no overlongs, surrogates or code points past U+10FFFF).
bool is_valid_utf8(const std::string& text);
/// True for paths ending in .html or .htm (case-insensitive).
bool looks_like_html_path(const std::string& path);

}  // namespace xpratt::cli
