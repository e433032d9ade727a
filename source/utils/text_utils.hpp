#ifndef TBMCPS_TEXT_UTILS_HPP
#define TBMCPS_TEXT_UTILS_HPP

// Small string helpers shared by the manifest, executor and protocol layers.

#include <string>
#include <vector>

namespace text_utils {

// Strips leading and trailing ASCII whitespace.
std::string trim(const std::string &text);

std::string to_lower(const std::string &text);
std::string to_upper(const std::string &text);

std::string join(const std::vector<std::string> &parts, const std::string &separator);

bool starts_with(const std::string &text, const std::string &prefix);

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
// Subprocess output is arbitrary bytes; JSON strings must be valid UTF-8.
std::string sanitize_utf8(const std::string &text);

} // namespace text_utils

#endif // TBMCPS_TEXT_UTILS_HPP
