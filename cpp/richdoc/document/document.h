#ifndef RICHDOC_DOCUMENT_DOCUMENT_H
#define RICHDOC_DOCUMENT_DOCUMENT_H

#include "richdoc/delta/delta.h"
#include "richdoc/document/attribute.h"
#include "richdoc/rules/rule_engine.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace richdoc::document {

enum class ChangeSource : std::uint8_t {
    Local = 0,
    Remote = 1,
};

struct DocumentChange {
    delta::Delta before;
    delta::Delta change;
    ChangeSource source;
};

using ChangeListener = std::function<void(const DocumentChange&)>;

/**
 * Document: owner of the authoritative Delta.
 *
 * The contents are always a document Delta (inserts only) ending with a
 * newline. compose() is the single mutation point: a patch is either applied
 * whole or rejected with the document left untouched. Listeners run after
 * each applied change.
 */
class Document {
public:
    Document();

    /**
     * Throws std::invalid_argument when `contents` holds retains or deletes,
     * or does not end with a newline.
     */
    explicit Document(delta::Delta contents);

    static Document fromJson(std::string_view json);

    // ==========================================================================
    // Queries
    // ==========================================================================

    const delta::Delta& toDelta() const noexcept { return delta_; }
    std::uint32_t length() const noexcept { return delta_.length(); }

    // Embeds are rendered as U+FFFC.
    std::string toPlainText() const;

    // FNV-1a over operations, text and attributes.
    std::uint64_t digest() const;

    /**
     * Attributes shared by everything in [index, index + length): inline
     * keys common to the characters in range, block keys common to the
     * newlines ending the touched lines. A caret (length 0) reports the
     * inline style of the character before it and the style of its line.
     * Throws like format().
     */
    AttributeMap collectStyle(std::uint32_t index, std::uint32_t length) const;

    // ==========================================================================
    // Edits
    // ==========================================================================

    /**
     * Format [index, index + length) and return the applied patch.
     * Throws std::out_of_range when the range exceeds the document and
     * std::invalid_argument when an end splits a surrogate pair.
     */
    delta::Delta format(
        std::uint32_t index,
        std::uint32_t length,
        const Attribute& attribute,
        std::optional<std::string> data = std::nullopt
    );

    delta::Delta insert(std::uint32_t index, std::string_view text, AttributeMap attributes = {});
    delta::Delta insert(std::uint32_t index, delta::Embed embed, AttributeMap attributes = {});
    delta::Delta remove(std::uint32_t index, std::uint32_t length);

    /**
     * Merge `patch` into the document. Throws std::runtime_error, without
     * changing anything, when the result would not be a valid document.
     * A patch that splits a surrogate pair throws std::invalid_argument,
     * also without changing anything.
     */
    void compose(const delta::Delta& patch, ChangeSource source);

    // ==========================================================================
    // Listeners & configuration
    // ==========================================================================

    std::uint32_t addListener(ChangeListener listener);
    bool removeListener(std::uint32_t id);

    rules::RuleEngine& rules() noexcept { return rules_; }
    const rules::RuleEngine& rules() const noexcept { return rules_; }

    static bool isValidDocument(const delta::Delta& contents);

private:
    void checkRange(std::uint32_t index, std::uint32_t length) const;
    void checkBoundary(std::uint32_t position) const;

    delta::Delta delta_;
    rules::RuleEngine rules_;
    std::vector<std::pair<std::uint32_t, ChangeListener>> listeners_;
    std::uint32_t nextListenerId_ = 1;
};

} // namespace richdoc::document

#endif // RICHDOC_DOCUMENT_DOCUMENT_H
