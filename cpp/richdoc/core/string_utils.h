#pragma once

#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

namespace richdoc {

// =============================================================================
// UTF-8 / UTF-16 Index Conversion
//
// Content is stored as UTF-8 while every length and index in a Delta is
// counted in UTF-16 code units ("logical" units).
// =============================================================================

inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        if ((c1 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | (c1 & 0x3F);
    }

    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 3;
        return ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
    }

    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        const unsigned char c3 = static_cast<unsigned char>(content[pos + 3]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80 || (c3 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 4;
        return ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
    }

    byteLen = 1;
    return 0xFFFD;
}

// Logical index to UTF-8 byte offset; inside a surrogate pair rounds down.
inline std::uint32_t logicalToByteIndex(std::string_view content, std::uint32_t logicalIndex) {
    std::uint32_t bytePos = 0;
    std::uint32_t logicalCount = 0;
    const std::size_t n = content.size();
    while (bytePos < n && logicalCount < logicalIndex) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, bytePos, byteLen);
        if (byteLen == 0) break;
        const std::uint32_t units = cp > 0xFFFF ? 2u : 1u;
        if (logicalCount + units > logicalIndex) break;
        logicalCount += units;
        bytePos += byteLen;
    }
    return static_cast<std::uint32_t>(bytePos);
}

// UTF-8 byte offset to logical index.
inline std::uint32_t byteToLogicalIndex(std::string_view content, std::uint32_t byteIndex) {
    std::uint32_t logicalCount = 0;
    const std::size_t n = content.size();
    const std::size_t limit = std::min<std::size_t>(n, byteIndex);
    std::size_t pos = 0;
    while (pos < limit) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0 || pos + byteLen > limit) break;
        logicalCount += cp > 0xFFFF ? 2u : 1u;
        pos += byteLen;
    }
    return logicalCount;
}

inline std::uint32_t utf16Length(std::string_view content) {
    return byteToLogicalIndex(content, static_cast<std::uint32_t>(content.size()));
}

/**
 * False when logicalIndex falls between the two halves of a surrogate pair.
 * Indices at or past the end are boundaries.
 */
inline bool isLogicalBoundary(std::string_view content, std::uint32_t logicalIndex) {
    const std::uint32_t byteIndex = logicalToByteIndex(content, logicalIndex);
    if (byteIndex >= content.size()) {
        return logicalIndex >= utf16Length(content);
    }
    return byteToLogicalIndex(content, byteIndex) == logicalIndex;
}

// Substring by logical range [start, start + length).
inline std::string sliceLogical(std::string_view content, std::uint32_t start, std::uint32_t length) {
    const std::uint32_t byteStart = logicalToByteIndex(content, start);
    const std::string_view tail = content.substr(byteStart);
    const std::uint32_t byteLen = logicalToByteIndex(tail, length);
    return std::string(tail.substr(0, byteLen));
}

/**
 * Logical index of the first '\n' at or after fromLogical, if any.
 */
inline std::optional<std::uint32_t> findNewline(std::string_view content, std::uint32_t fromLogical = 0) {
    const std::uint32_t byteStart = logicalToByteIndex(content, fromLogical);
    const std::size_t lf = content.find('\n', byteStart);
    if (lf == std::string_view::npos) {
        return std::nullopt;
    }
    return byteToLogicalIndex(content, static_cast<std::uint32_t>(lf));
}

} // namespace richdoc
