#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace coop_catalog {

/// Strip leading and trailing Unicode whitespace from UTF-8 text
/// (ASCII blanks, NO-BREAK SPACE, IDEOGRAPHIC SPACE, line separators...).
/// Stops at the first malformed byte sequence on either side.
std::string trim(const std::string& text);

/// Full Unicode lowercase of UTF-8 text (Boost.Locale, ICU backend).
std::string toLower(const std::string& text);

/// Number of Unicode code points in a UTF-8 string.
/// Continuation bytes are not counted, so malformed input never throws.
std::size_t utf8Length(const std::string& text);

/// Parse a UUID written as 8-4-4-4-12 hex groups or as 32 bare hex digits,
/// in any letter case.  Returns the canonical lowercase hyphenated form,
/// or std::nullopt when the text is not a UUID.
std::optional<std::string> normalizeUuid(const std::string& text);

} // namespace coop_catalog
