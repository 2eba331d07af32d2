#pragma once

#include <string>
#include <string_view>

namespace feedctl::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep header parsing deterministic.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Escapes the five XML special characters (& < > " ') as named entities.
/// MUST leave every other byte untouched so UTF-8 text passes through.
std::string escape_xml(std::string_view text);
/// Returns true when the text is empty or contains only ASCII whitespace.
bool is_blank(std::string_view text);

}  // namespace feedctl::util
