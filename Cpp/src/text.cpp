#include "droidbridge/text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <random>

namespace droidbridge {

namespace {

const char* const WHITESPACE = " \t\n\r\f\v";
const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the valid UTF-8 sequence starting at `pos`, or 0 if invalid.
size_t utf8_sequence_length(const std::string& bytes, size_t pos) {
    auto lead = static_cast<unsigned char>(bytes[pos]);
    size_t length = 0;
    uint32_t min_code_point = 0;

    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        min_code_point = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        min_code_point = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        min_code_point = 0x10000;
    } else {
        return 0;
    }

    if (pos + length > bytes.size()) {
        return 0;
    }

    uint32_t code_point = lead & (0xFF >> (length + 1));
    for (size_t i = 1; i < length; ++i) {
        auto c = static_cast<unsigned char>(bytes[pos + i]);
        if (!is_continuation(c)) {
            return 0;
        }
        code_point = (code_point << 6) | (c & 0x3F);
    }

    // Overlong encodings, surrogates and out-of-range values
    if (code_point < min_code_point || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return 0;
    }
    return length;
}

} // namespace

std::string sanitize_utf8(const std::string& bytes) {
    std::string decoded;
    decoded.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t length = utf8_sequence_length(bytes, pos);
        if (length == 0) {
            decoded += REPLACEMENT_CHARACTER;
            ++pos;
            continue;
        }
        decoded.append(bytes, pos, length);
        pos += length;
    }
    return decoded;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(WHITESPACE);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(begin, end - begin + 1);
}

std::string trim_right(const std::string& text) {
    size_t end = text.find_last_not_of(WHITESPACE);
    if (end == std::string::npos) {
        return "";
    }
    return text.substr(0, end + 1);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    if (text.empty()) {
        return lines;
    }

    size_t start = 0;
    while (true) {
        size_t end = text.find('\n', start);
        std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return lines;
}

std::string filter_lines(const std::string& text, const std::regex& pattern) {
    std::string kept;
    for (const auto& line : split_lines(text)) {
        if (std::regex_search(line, pattern)) {
            if (!kept.empty()) kept += '\n';
            kept += line;
        }
    }
    return kept;
}

std::string regex_escape(const std::string& literal) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string escaped;
    for (char c : literal) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string random_uuid() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t high = dist(engine);
    uint64_t low = dist(engine);

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32),
                  static_cast<unsigned>((high >> 16) & 0xFFFF),
                  static_cast<unsigned>(high & 0xFFFF),
                  static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return buffer;
}

} // namespace droidbridge
