#pragma once

#include <optional>
#include <string>
#include <vector>

namespace discount_rules {

/// Strip leading and trailing whitespace (ASCII and the Unicode space
/// characters, UTF-8 encoded).
std::string trim(const std::string& s);

/// Split on @p delimiter, keeping empty fields ("a,,b" -> "a", "", "b").
std::vector<std::string> split(const std::string& s, char delimiter);

/// Split a comma-separated list, trim every entry and drop the empty ones.
std::vector<std::string> splitCommaList(const std::string& s);

/// Lenient 32-bit integer parse: surrounding ASCII whitespace and a leading
/// sign are accepted, anything else (including overflow) yields nullopt.
std::optional<int> tryParseInt(const std::string& s);

/// True when @p s is empty or contains whitespace only (same set as trim).
bool isBlank(const std::string& s);

} // namespace discount_rules
