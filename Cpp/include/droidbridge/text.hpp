#ifndef DROIDBRIDGE_TEXT_HPP
#define DROIDBRIDGE_TEXT_HPP

#include <regex>
#include <string>
#include <vector>

namespace droidbridge {

// Replace invalid UTF-8 sequences with U+FFFD instead of failing.
std::string sanitize_utf8(const std::string& bytes);

std::string trim(const std::string& text);
std::string trim_right(const std::string& text);

std::string to_lower(std::string text);
std::string to_upper(std::string text);

// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& text);

// Keep only the lines that contain a match of `pattern`.
std::string filter_lines(const std::string& text, const std::regex& pattern);

// Escape every regex metacharacter so `literal` matches itself.
std::string regex_escape(const std::string& literal);

// Random RFC 4122 version 4 identifier, e.g. "3b241101-e2bb-4255-8caf-4136c566a962".
std::string random_uuid();

} // namespace droidbridge

#endif // DROIDBRIDGE_TEXT_HPP
