#include "string_util.h"

#include <cctype>

namespace xpratt::util {

namespace {

bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}

bool is_letter(unsigned char c) {
  return std::isalpha(c) != 0;
}

}  // namespace

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string to_upper(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && is_space(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && is_space(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::string normalize_space(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (char c : s) {
    if (is_space(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out.push_back(' ');
    pending_space = false;
    out.push_back(c);
  }
  return out;
}

std::string title_case(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool previous_letter = false;
  for (char c : s) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (is_letter(uc)) {
      out.push_back(static_cast<char>(previous_letter ? std::tolower(uc) : std::toupper(uc)));
      previous_letter = true;
    } else {
      out.push_back(c);
      previous_letter = false;
    }
  }
  return out;
}

bool has_whitespace(const std::string& s) {
  for (char c : s) {
    if (is_space(static_cast<unsigned char>(c))) return true;
  }
  return false;
}

}  // namespace xpratt::util
