#pragma once

#include <string>

namespace xpratt::util {

/// Converts a string to lowercase without consulting the locale.
std::string to_lower(const std::string& s);
/// Converts a string to uppercase without consulting the locale.
std::string to_upper(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Trims and collapses internal whitespace runs to a single space.
std::string normalize_space(const std::string& s);
/// Uppercases each letter that follows a non-letter and lowercases the others.
std::string title_case(const std::string& s);
bool has_whitespace(const std::string& s);

}  // namespace xpratt::util
