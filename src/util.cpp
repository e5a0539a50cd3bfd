#include "util.hpp"

#include <boost/locale/conversion.hpp>
#include <boost/locale/generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <locale>
#include <stdexcept>

namespace coop_catalog {

namespace {

// Unicode White_Space plus the ASCII information separators U+001C..U+001F.
bool isSpace(std::uint32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) ||
           cp == 0x85 || cp == 0xA0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000;
}

bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

/// Decode the code point starting at @p pos.  Returns the number of bytes
/// it occupies, or 0 when the sequence there is not well-formed UTF-8.
std::size_t decodeAt(const std::string& text, std::size_t pos, std::uint32_t& cp) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t size = 0;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        size = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        size = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        size = 4;
    } else {
        return 0;
    }

    if (pos + size > text.size()) {
        return 0;
    }
    for (std::size_t i = 1; i < size; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if (!isContinuation(byte)) {
            return 0;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }
    return size;
}

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string trim(const std::string& text) {
    std::uint32_t cp = 0;

    std::size_t begin = 0;
    while (begin < text.size()) {
        const std::size_t size = decodeAt(text, begin, cp);
        if (size == 0 || !isSpace(cp)) {
            break;
        }
        begin += size;
    }

    std::size_t end = text.size();
    while (end > begin) {
        // Back up to the lead byte of the last code point.
        std::size_t start = end - 1;
        while (start > begin && end - start < 4 &&
               isContinuation(static_cast<unsigned char>(text[start]))) {
            --start;
        }
        const std::size_t size = decodeAt(text, start, cp);
        if (size != end - start || !isSpace(cp)) {
            break;
        }
        end = start;
    }

    return text.substr(begin, end - begin);
}

std::string toLower(const std::string& text) {
    static const std::locale utf8 = boost::locale::generator()("en_US.UTF-8");
    return boost::locale::to_lower(text, utf8);
}

std::size_t utf8Length(const std::string& text) {
    return static_cast<std::size_t>(
        std::count_if(text.begin(), text.end(), [](char c) {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
}

std::optional<std::string> normalizeUuid(const std::string& text) {
    // --- shape check ---
    if (text.size() == 36) {
        for (std::size_t i = 0; i < text.size(); ++i) {
            const bool dashSlot = (i == 8 || i == 13 || i == 18 || i == 23);
            if (dashSlot ? text[i] != '-' : !isHex(text[i])) {
                return std::nullopt;
            }
        }
    } else if (text.size() == 32) {
        if (!std::all_of(text.begin(), text.end(), isHex)) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    // --- canonical form ---
    try {
        boost::uuids::string_generator gen;
        return boost::uuids::to_string(gen(text));
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

} // namespace coop_catalog
