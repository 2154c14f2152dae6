#include "droidbridge/command_line.hpp"
#include "droidbridge/errors.hpp"
#include "droidbridge/text.hpp"

#include <utility>

namespace droidbridge {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool needs_quoting(const std::string& token) {
    if (token.empty()) return true;
    for (char c : token) {
        if (is_space(c) || c == '\'' || c == '"' || c == '\\' || c == '$' || c == '`') {
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<std::string> split_command(const std::string& cmd) {
    enum class State { Normal, Single, Double };

    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    State state = State::Normal;

    for (size_t i = 0; i < cmd.size(); ++i) {
        char c = cmd[i];
        switch (state) {
        case State::Normal:
            if (is_space(c)) {
                if (in_token) {
                    tokens.push_back(current);
                    current.clear();
                    in_token = false;
                }
            } else if (c == '\'') {
                state = State::Single;
                in_token = true;
            } else if (c == '"') {
                state = State::Double;
                in_token = true;
            } else if (c == '\\') {
                if (i + 1 >= cmd.size()) {
                    throw InvalidArgumentError("No escaped character in command: " + cmd);
                }
                current += cmd[++i];
                in_token = true;
            } else {
                current += c;
                in_token = true;
            }
            break;

        case State::Single:
            if (c == '\'') {
                state = State::Normal;
            } else {
                current += c;
            }
            break;

        case State::Double:
            if (c == '"') {
                state = State::Normal;
            } else if (c == '\\' && i + 1 < cmd.size() &&
                       (cmd[i + 1] == '"' || cmd[i + 1] == '\\' ||
                        cmd[i + 1] == '$' || cmd[i + 1] == '`')) {
                current += cmd[++i];
            } else {
                current += c;
            }
            break;
        }
    }

    if (state != State::Normal) {
        throw InvalidArgumentError("No closing quotation in command: " + cmd);
    }
    if (in_token) {
        tokens.push_back(current);
    }
    return tokens;
}

std::string shell_escape(const std::string& str) {
    std::string escaped = "'";
    for (char c : str) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped += c;
        }
    }
    escaped += "'";
    return escaped;
}

std::string join_command(const std::vector<std::string>& tokens) {
    std::string joined;
    for (const auto& token : tokens) {
        if (!joined.empty()) joined += ' ';
        if (!needs_quoting(token)) {
            joined += token;
            continue;
        }
        joined += shell_escape(token);
    }
    return joined;
}

CommandLine::CommandLine(const std::string& raw) : tokens_(split_command(raw)) {
    normalize();
}

CommandLine::CommandLine(const char* raw) {
    if (raw != nullptr) {
        tokens_ = split_command(raw);
    }
    normalize();
}

CommandLine::CommandLine(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {
    normalize();
}

CommandLine::CommandLine(std::initializer_list<std::string> tokens) : tokens_(tokens) {
    normalize();
}

CommandLine& CommandLine::prepend(const std::vector<std::string>& head) {
    tokens_.insert(tokens_.begin(), head.begin(), head.end());
    return *this;
}

CommandLine& CommandLine::append(const CommandLine& tail) {
    tokens_.insert(tokens_.end(), tail.tokens_.begin(), tail.tokens_.end());
    return *this;
}

void CommandLine::normalize() {
    for (auto& token : tokens_) {
        if (token.find('\0') != std::string::npos) {
            throw InvalidArgumentError("Command arguments must not contain NUL bytes");
        }
        token = trim(token);
    }
}

} // namespace droidbridge
