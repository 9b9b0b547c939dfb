#include "cli_parse.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>

namespace tilecut::core {

namespace {

constexpr int k_hex_base = 16;
constexpr int k_unicode_escape_digits = 4;
constexpr unsigned int k_high_surrogate_first = 0xD800;
constexpr unsigned int k_low_surrogate_first = 0xDC00;
constexpr unsigned int k_low_surrogate_last = 0xDFFF;

bool parse_hex4(std::string_view input, size_t& pos, unsigned int& out) {
    if (pos + k_unicode_escape_digits > input.size()) {
        return false;
    }
    unsigned int value = 0;
    const char* begin = input.data() + pos;
    const char* end = begin + k_unicode_escape_digits;
    const auto [ptr, ec] = std::from_chars(begin, end, value, k_hex_base);
    if (ec != std::errc() || ptr != end) {
        return false;
    }
    pos += k_unicode_escape_digits;
    out = value;
    return true;
}

void append_utf8(unsigned int cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Reads the XXXX of a \uXXXX escape, joining a surrogate pair into one code point.
bool parse_unicode_escape(std::string_view input, size_t& pos, std::string& out, std::string& error) {
    unsigned int cp = 0;
    if (!parse_hex4(input, pos, cp)) {
        error = "invalid \\u escape";
        return false;
    }
    if (cp >= k_low_surrogate_first && cp <= k_low_surrogate_last) {
        error = "unpaired low surrogate in \\u escape";
        return false;
    }
    if (cp >= k_high_surrogate_first && cp < k_low_surrogate_first) {
        unsigned int low = 0;
        if (pos + 2 > input.size() || input[pos] != '\\' || input[pos + 1] != 'u') {
            error = "unpaired high surrogate in \\u escape";
            return false;
        }
        pos += 2;
        if (!parse_hex4(input, pos, low) || low < k_low_surrogate_first || low > k_low_surrogate_last) {
            error = "invalid low surrogate in \\u escape";
            return false;
        }
        cp = 0x10000 + ((cp - k_high_surrogate_first) << 10) + (low - k_low_surrogate_first);
    }
    append_utf8(cp, out);
    return true;
}

} // namespace

bool parse_positive_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed <= 0 || parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_double(const std::string& token, double& out) {
    if (token.empty()) {
        return false;
    }
    std::istringstream iss(token);
    double value = 0.0;
    char extra = '\0';
    if (!(iss >> value)) {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    if (!std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

bool parse_positive_double(const std::string& token, double& out) {
    double parsed = 0.0;
    if (!parse_double(token, parsed) || parsed <= 0.0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_quoted(std::string_view input, size_t& pos, std::string& out, std::string& error) {
    if (pos >= input.size() || input[pos] != '"') {
        error = "expected opening quote";
        return false;
    }

    ++pos;
    out.clear();

    while (pos < input.size()) {
        char c = input[pos++];
        if (c == '\\') {
            if (pos >= input.size()) {
                error = "unterminated escape sequence";
                return false;
            }
            char escaped = input[pos++];
            switch (escaped) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u':
                    if (!parse_unicode_escape(input, pos, out, error)) {
                        return false;
                    }
                    break;
                default:
                    error = std::string("invalid escape sequence \\") + escaped;
                    return false;
            }
        } else if (c == '"') {
            return true;
        } else {
            out.push_back(c);
        }
    }

    error = "unterminated quoted string";
    return false;
}

std::string to_lower_copy(std::string value) {
    std::ranges::transform(value, value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace tilecut::core
