#ifndef DROIDBRIDGE_COMMAND_LINE_HPP
#define DROIDBRIDGE_COMMAND_LINE_HPP

#include <initializer_list>
#include <string>
#include <vector>

namespace droidbridge {

/**
 * Split a command string into tokens using POSIX shell quoting rules.
 * Supports single quotes, double quotes and backslash escapes.
 * Throws InvalidArgumentError on an unterminated quote or dangling escape.
 */
std::vector<std::string> split_command(const std::string& cmd);

/**
 * Join tokens back into a single printable command string.
 * Tokens containing whitespace or quotes are single-quoted.
 */
std::string join_command(const std::vector<std::string>& tokens);

// Single-quote a string for the device shell ("it's" -> 'it'\''s').
std::string shell_escape(const std::string& str);

/**
 * An argument vector given either as one raw string (lexed with
 * split_command) or as a pre-tokenized sequence. Normalized once on
 * construction: every token is trimmed of surrounding whitespace and
 * tokens containing NUL bytes are rejected.
 */
class CommandLine {
public:
    CommandLine() = default;
    CommandLine(const std::string& raw);
    CommandLine(const char* raw);
    CommandLine(std::vector<std::string> tokens);
    CommandLine(std::initializer_list<std::string> tokens);

    const std::vector<std::string>& tokens() const { return tokens_; }
    bool empty() const { return tokens_.empty(); }
    size_t size() const { return tokens_.size(); }

    CommandLine& prepend(const std::vector<std::string>& head);
    CommandLine& append(const CommandLine& tail);

    std::string str() const { return join_command(tokens_); }

private:
    void normalize();

    std::vector<std::string> tokens_;
};

} // namespace droidbridge

#endif // DROIDBRIDGE_COMMAND_LINE_HPP
