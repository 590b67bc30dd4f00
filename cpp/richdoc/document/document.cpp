#include "richdoc/document/document.h"
#include "richdoc/core/constants.h"
#include "richdoc/core/digest.h"
#include "richdoc/core/logging.h"
#include "richdoc/core/string_utils.h"
#include "richdoc/delta/delta_iterator.h"
#include "richdoc/delta/delta_json.h"
#include <algorithm>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace richdoc::document {

using delta::Delta;
using delta::DeltaIterator;
using delta::Operation;

namespace {

bool isNoOp(const Delta& patch) {
    return std::all_of(patch.begin(), patch.end(), [](const Operation& op) {
        return op.isRetain() && !op.hasAttributes();
    });
}

bool splitsSurrogatePair(const Delta& contents, std::uint32_t position) {
    std::uint32_t start = 0;
    for (const Operation& op : contents) {
        if (position < start + op.length) {
            return op.isTextInsert() && !isLogicalBoundary(op.text, position - start);
        }
        start += op.length;
    }
    return false;
}

bool isBlockKey(const std::string& key) {
    const AttributeInfo* info = AttributeCatalog::find(key);
    return info && info->scope == AttributeScope::Block;
}

// Narrow `acc` to the entries of `attributes` (block or non-block keys only)
// that it shares with equal values. The first contribution seeds it.
void intersectStyle(std::optional<AttributeMap>& acc, const AttributeMap& attributes, bool blockKeys) {
    AttributeMap filtered;
    for (const auto& [key, value] : attributes) {
        if (isBlockKey(key) == blockKeys) {
            filtered.set(key, value);
        }
    }
    if (!acc) {
        acc = std::move(filtered);
        return;
    }
    AttributeMap common;
    for (const auto& [key, value] : *acc) {
        const delta::AttributeValue* other = filtered.find(key);
        if (other && *other == value) {
            common.set(key, value);
        }
    }
    acc = std::move(common);
}

bool hasContent(const Operation& op) {
    return op.isEmbed() || op.text.find_first_not_of(kNewline) != std::string::npos;
}

bool hasNewline(const Operation& op) {
    return op.isTextInsert() && op.text.find(kNewline) != std::string::npos;
}

std::uint64_t hashValue(std::uint64_t h, const delta::AttributeValue& value) {
    h = hashU32(h, static_cast<std::uint32_t>(value.index()));
    return std::visit([h](const auto& v) -> std::uint64_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return h;
        } else if constexpr (std::is_same_v<T, bool>) {
            return hashU32(h, v ? 1u : 0u);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return hashU64(h, static_cast<std::uint64_t>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            return hashF64(h, v);
        } else {
            return hashString(h, v);
        }
    }, value);
}

} // namespace

Document::Document() {
    delta_.insert(kEmptyDocumentText);
}

Document::Document(Delta contents) : delta_(std::move(contents)) {
    if (!isValidDocument(delta_)) {
        throw std::invalid_argument("Document requires insert-only contents ending with a newline");
    }
}

Document Document::fromJson(std::string_view json) {
    return Document(delta::deltaFromJsonString(json));
}

bool Document::isValidDocument(const Delta& contents) {
    if (contents.empty() || !contents.isDocument()) {
        return false;
    }
    const Operation& last = contents.back();
    return last.isTextInsert() && !last.text.empty() && last.text.back() == kNewline;
}

// =============================================================================
// Queries
// =============================================================================

std::string Document::toPlainText() const {
    std::string out;
    for (const Operation& op : delta_) {
        if (op.isEmbed()) {
            out += kObjectReplacement;
        } else {
            out += op.text;
        }
    }
    return out;
}

std::uint64_t Document::digest() const {
    std::uint64_t h = kDigestOffset;
    h = hashU32(h, static_cast<std::uint32_t>(delta_.size()));
    for (const Operation& op : delta_) {
        h = hashU32(h, static_cast<std::uint32_t>(op.type));
        h = hashU32(h, op.length);
        if (op.embed) {
            h = hashString(h, op.embed->type);
            h = hashString(h, op.embed->data);
        } else {
            h = hashString(h, op.text);
        }
        h = hashU32(h, static_cast<std::uint32_t>(op.attributes.size()));
        for (const auto& [key, value] : op.attributes) {
            h = hashString(h, key);
            h = hashValue(h, value);
        }
    }
    return h;
}

AttributeMap Document::collectStyle(std::uint32_t index, std::uint32_t length) const {
    checkRange(index, length);

    std::optional<AttributeMap> inlineStyle;
    std::optional<AttributeMap> lineStyle;
    DeltaIterator it(delta_);
    const std::optional<Operation> before = it.skip(index);

    bool lineClosed = false;
    if (length == 0) {
        // A caret takes the inline style of the character before it.
        if (before && (before->isEmbed() || (!before->text.empty() && before->text.back() != kNewline))) {
            intersectStyle(inlineStyle, before->attributes, false);
        }
    } else {
        std::uint32_t consumed = 0;
        while (consumed < length && it.hasNext()) {
            const Operation piece = it.next(length - consumed);
            consumed += piece.length;
            if (hasContent(piece)) {
                intersectStyle(inlineStyle, piece.attributes, false);
            }
            if (hasNewline(piece)) {
                intersectStyle(lineStyle, piece.attributes, true);
            }
            lineClosed = piece.isTextInsert() && piece.text.back() == kNewline;
        }
    }

    // Terminator of the line the range ends on.
    while (!lineClosed && it.hasNext()) {
        const Operation op = it.next();
        if (hasNewline(op)) {
            intersectStyle(lineStyle, op.attributes, true);
            lineClosed = true;
        }
    }

    AttributeMap style = inlineStyle.value_or(AttributeMap{});
    if (lineStyle) {
        for (const auto& [key, value] : *lineStyle) {
            style.set(key, value);
        }
    }
    return style;
}

// =============================================================================
// Edits
// =============================================================================

void Document::checkRange(std::uint32_t index, std::uint32_t length) const {
    const std::uint32_t docLength = this->length();
    if (index > docLength || length > docLength - index) {
        RICHDOC_LOG_WARN("range %u+%u outside document of length %u", index, length, docLength);
        throw std::out_of_range("Range [" + std::to_string(index) + ", +" + std::to_string(length)
            + ") exceeds document length " + std::to_string(docLength));
    }
    checkBoundary(index);
    checkBoundary(index + length);
}

void Document::checkBoundary(std::uint32_t position) const {
    if (splitsSurrogatePair(delta_, position)) {
        RICHDOC_LOG_WARN("position %u splits a surrogate pair", position);
        throw std::invalid_argument("Position " + std::to_string(position) + " splits a surrogate pair");
    }
}

Delta Document::format(
    std::uint32_t index,
    std::uint32_t length,
    const Attribute& attribute,
    std::optional<std::string> data
) {
    checkRange(index, length);
    Delta patch = rules_.format(delta_, index, length, attribute, std::move(data));
    if (!isNoOp(patch)) {
        compose(patch, ChangeSource::Local);
    }
    return patch;
}

Delta Document::insert(std::uint32_t index, std::string_view text, AttributeMap attributes) {
    // Nothing may follow the trailing newline.
    if (index >= length()) {
        throw std::out_of_range("Insert position " + std::to_string(index) + " is past the last line");
    }
    checkBoundary(index);
    Delta patch;
    patch.retain(index);
    patch.insert(text, std::move(attributes));
    if (!isNoOp(patch)) {
        compose(patch, ChangeSource::Local);
    }
    return patch;
}

Delta Document::insert(std::uint32_t index, delta::Embed embed, AttributeMap attributes) {
    if (index >= length()) {
        throw std::out_of_range("Insert position " + std::to_string(index) + " is past the last line");
    }
    checkBoundary(index);
    Delta patch;
    patch.retain(index);
    patch.insert(std::move(embed), std::move(attributes));
    if (!isNoOp(patch)) {
        compose(patch, ChangeSource::Local);
    }
    return patch;
}

Delta Document::remove(std::uint32_t index, std::uint32_t length) {
    checkRange(index, length);
    Delta patch;
    patch.retain(index);
    patch.remove(length);
    if (!isNoOp(patch)) {
        compose(patch, ChangeSource::Local);
    }
    return patch;
}

void Document::compose(const Delta& patch, ChangeSource source) {
    Delta next = delta_.compose(patch);
    if (!isValidDocument(next)) {
        RICHDOC_LOG_WARN("rejected patch of %zu ops: result is not a valid document", patch.size());
        throw std::runtime_error("Patch would leave the document invalid");
    }

    DocumentChange change{std::move(delta_), patch, source};
    delta_ = std::move(next);

    // Copy so listeners may unregister themselves while being notified.
    const auto listeners = listeners_;
    for (const auto& [id, listener] : listeners) {
        listener(change);
    }
}

// =============================================================================
// Listeners
// =============================================================================

std::uint32_t Document::addListener(ChangeListener listener) {
    if (!listener) {
        throw std::invalid_argument("Document listener must be callable");
    }
    const std::uint32_t id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool Document::removeListener(std::uint32_t id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(), [id](const auto& entry) {
        return entry.first == id;
    });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

} // namespace richdoc::document
