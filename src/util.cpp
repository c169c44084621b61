#include "util.hpp"

#include <cstdint>
#include <limits>
#include <utility>

namespace discount_rules {

namespace {

bool isAsciiSpace(char c) {
    return c == ' ' || (c >= '\t' && c <= '\r');
}

// Byte length of the whitespace character starting at @p pos, 0 if none.
// Besides ASCII this covers the UTF-8 encodings of U+0085, U+00A0, U+1680,
// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
std::size_t spaceAt(const std::string& s, std::size_t pos) {
    const auto byte = [&s](std::size_t i) {
        return static_cast<unsigned char>(s[i]);
    };

    if (pos >= s.size()) return 0;
    if (isAsciiSpace(s[pos])) return 1;

    const std::size_t left = s.size() - pos;
    const unsigned char b0 = byte(pos);

    if (b0 == 0xC2 && left >= 2) {
        const unsigned char b1 = byte(pos + 1);
        return (b1 == 0x85 || b1 == 0xA0) ? 2 : 0;
    }
    if (left < 3) return 0;

    const unsigned char b1 = byte(pos + 1);
    const unsigned char b2 = byte(pos + 2);

    if (b0 == 0xE1) return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
    if (b0 == 0xE3) return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
    if (b0 == 0xE2) {
        if (b1 == 0x80 && ((b2 >= 0x80 && b2 <= 0x8A) ||
                           b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) {
            return 3;
        }
        if (b1 == 0x81 && b2 == 0x9F) return 3;
    }
    return 0;
}

// Byte length of the whitespace character ending just before @p end.
std::size_t spaceBefore(const std::string& s, std::size_t end) {
    for (std::size_t n = 1; n <= 3 && n <= end; ++n) {
        if (spaceAt(s, end - n) == n) return n;
    }
    return 0;
}

std::string trimAscii(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end   = s.size();

    while (begin < end && isAsciiSpace(s[begin])) ++begin;
    while (end > begin && isAsciiSpace(s[end - 1])) --end;

    return s.substr(begin, end - begin);
}

} // namespace

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end   = s.size();

    while (begin < end) {
        const auto n = spaceAt(s, begin);
        if (n == 0) break;
        begin += n;
    }
    while (end > begin) {
        const auto n = spaceBefore(s, end);
        if (n == 0 || end - n < begin) break;
        end -= n;
    }

    return s.substr(begin, end - begin);
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;

    std::size_t start = 0;
    while (true) {
        auto pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> splitCommaList(const std::string& s) {
    std::vector<std::string> entries;
    for (const auto& field : split(s, ',')) {
        auto entry = trim(field);
        if (!entry.empty()) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

std::optional<int> tryParseInt(const std::string& s) {
    // Numbers only tolerate ASCII whitespace around them.
    const std::string text = trimAscii(s);
    if (text.empty()) return std::nullopt;

    std::size_t i = 0;
    bool negative = false;
    if (text[i] == '+' || text[i] == '-') {
        negative = (text[i] == '-');
        ++i;
    }
    if (i == text.size()) return std::nullopt;

    // Accumulate in 64 bits; bail out as soon as the 32-bit range is left.
    const int64_t limit = negative
        ? -static_cast<int64_t>(std::numeric_limits<int>::min())
        : static_cast<int64_t>(std::numeric_limits<int>::max());

    int64_t value = 0;
    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + (c - '0');
        if (value > limit) return std::nullopt;
    }

    return static_cast<int>(negative ? -value : value);
}

bool isBlank(const std::string& s) {
    std::size_t pos = 0;
    while (pos < s.size()) {
        const auto n = spaceAt(s, pos);
        if (n == 0) return false;
        pos += n;
    }
    return true;
}

} // namespace discount_rules
