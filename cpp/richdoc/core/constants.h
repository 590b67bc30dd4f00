#ifndef RICHDOC_CORE_CONSTANTS_H
#define RICHDOC_CORE_CONSTANTS_H

#include <cstdint>

namespace richdoc {

// Every embed occupies exactly one position in the document.
static constexpr std::uint32_t kEmbedLength = 1;

static constexpr char kNewline = '\n';

// Plain-text stand-in for an embed (U+FFFC OBJECT REPLACEMENT CHARACTER).
static constexpr const char* kObjectReplacement = "\xEF\xBF\xBC";

// Content of a freshly created, empty document.
static constexpr const char* kEmptyDocumentText = "\n";

} // namespace richdoc

#endif // RICHDOC_CORE_CONSTANTS_H
