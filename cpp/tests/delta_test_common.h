#pragma once

#include <gtest/gtest.h>
#include "richdoc/delta/delta.h"
#include "richdoc/delta/delta_iterator.h"
#include "richdoc/delta/delta_json.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace richdoc_test {

using richdoc::delta::AttributeMap;
using richdoc::delta::AttributeValue;
using richdoc::delta::Delta;
using richdoc::delta::DeltaIterator;
using richdoc::delta::Operation;

// Spelled-out value constructors; a bare literal would be ambiguous for the variant.
inline AttributeValue str(const char* s) { return std::string(s); }
inline AttributeValue num(std::int64_t v) { return v; }
inline AttributeValue null() { return std::monostate{}; }

inline Delta textDelta(std::string_view text) {
    Delta d;
    d.insert(text);
    return d;
}

// Readable diff for gtest failures.
inline std::string dump(const Delta& d) {
    return richdoc::delta::deltaToJsonString(d);
}

/**
 * No zero-length operation and no adjacent pair that push() would have merged.
 */
inline ::testing::AssertionResult isNormalized(const Delta& d) {
    for (std::size_t i = 0; i < d.size(); ++i) {
        if (d[i].length == 0) {
            return ::testing::AssertionFailure() << "zero-length op at " << i << " in " << dump(d);
        }
        if (i == 0) continue;
        const Operation& a = d[i - 1];
        const Operation& b = d[i];
        if (a.isDelete() && b.isDelete()) {
            return ::testing::AssertionFailure() << "adjacent deletes at " << i << " in " << dump(d);
        }
        if (a.isDelete() && b.isInsert()) {
            return ::testing::AssertionFailure() << "insert after delete at " << i << " in " << dump(d);
        }
        if (a.attributes == b.attributes
            && ((a.isRetain() && b.isRetain()) || (a.isTextInsert() && b.isTextInsert()))) {
            return ::testing::AssertionFailure() << "mergeable ops at " << i << " in " << dump(d);
        }
    }
    return ::testing::AssertionSuccess();
}

/**
 * Walk `patch` against `document` and report any attributed retain that
 * covers a newline.
 */
inline ::testing::AssertionResult noAttributedNewline(const Delta& document, const Delta& patch) {
    DeltaIterator doc(document);
    std::uint32_t position = 0;
    for (const Operation& op : patch) {
        if (!op.isRetain()) {
            return ::testing::AssertionFailure() << "unexpected " << richdoc::delta::opTypeName(op.type);
        }
        std::uint32_t remaining = op.length;
        while (remaining > 0 && doc.hasNext()) {
            const Operation piece = doc.next(remaining);
            remaining -= piece.length;
            if (op.hasAttributes() && piece.isTextInsert()
                && piece.text.find('\n') != std::string::npos) {
                return ::testing::AssertionFailure()
                    << "attributed retain over a newline near " << position << " in " << dump(patch);
            }
            position += piece.length;
        }
    }
    return ::testing::AssertionSuccess();
}

} // namespace richdoc_test
