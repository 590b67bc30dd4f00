#include "richdoc/delta/delta.h"
#include "richdoc/delta/delta_iterator.h"
#include <algorithm>

namespace richdoc::delta {

Delta::Delta(const std::vector<Operation>& ops) {
    ops_.reserve(ops.size());
    for (const auto& op : ops) {
        push(op);
    }
}

// =============================================================================
// Builders
// =============================================================================

Delta& Delta::insert(std::string_view text, AttributeMap attributes) {
    if (text.empty()) {
        return *this;
    }
    return push(Operation::makeInsert(std::string(text), std::move(attributes)));
}

Delta& Delta::insert(Embed embed, AttributeMap attributes) {
    return push(Operation::makeInsert(std::move(embed), std::move(attributes)));
}

Delta& Delta::retain(std::uint32_t length, AttributeMap attributes) {
    if (length == 0) {
        return *this;
    }
    return push(Operation::makeRetain(length, std::move(attributes)));
}

Delta& Delta::remove(std::uint32_t length) {
    if (length == 0) {
        return *this;
    }
    return push(Operation::makeDelete(length));
}

Delta& Delta::push(Operation op) {
    if (op.length == 0) {
        return *this;
    }
    if (op.isDelete()) {
        op.attributes.clear();
    }

    std::size_t index = ops_.size();
    if (index > 0) {
        if (op.isDelete() && ops_[index - 1].isDelete()) {
            ops_[index - 1].length += op.length;
            return *this;
        }

        // Canonical order: an insert next to a delete goes first.
        if (ops_[index - 1].isDelete() && op.isInsert()) {
            --index;
            if (index == 0) {
                ops_.insert(ops_.begin(), std::move(op));
                return *this;
            }
        }

        Operation& prev = ops_[index - 1];
        if (prev.attributes == op.attributes) {
            if (prev.isTextInsert() && op.isTextInsert()) {
                prev.text += op.text;
                prev.length += op.length;
                return *this;
            }
            if (prev.isRetain() && op.isRetain()) {
                prev.length += op.length;
                return *this;
            }
        }
    }

    ops_.insert(ops_.begin() + static_cast<std::ptrdiff_t>(index), std::move(op));
    return *this;
}

Delta& Delta::chop() {
    if (!ops_.empty() && ops_.back().isRetain() && !ops_.back().hasAttributes()) {
        ops_.pop_back();
    }
    return *this;
}

// =============================================================================
// Algebra
// =============================================================================

Delta Delta::concat(const Delta& other) const {
    Delta out = *this;
    if (!other.ops_.empty()) {
        out.push(other.ops_.front());
        out.ops_.insert(out.ops_.end(), other.ops_.begin() + 1, other.ops_.end());
    }
    return out;
}

Delta Delta::compose(const Delta& other) const {
    DeltaIterator thisIter(*this);
    DeltaIterator otherIter(other);
    Delta out;

    while (thisIter.hasNext() || otherIter.hasNext()) {
        if (otherIter.hasNext() && otherIter.peekType() == OpType::Insert) {
            out.push(otherIter.next());
            continue;
        }
        if (thisIter.hasNext() && thisIter.peekType() == OpType::Delete) {
            out.push(thisIter.next());
            continue;
        }
        // One side ran out: the other passes through unchanged.
        if (!otherIter.hasNext()) {
            out.push(thisIter.next());
            continue;
        }
        if (!thisIter.hasNext()) {
            out.push(otherIter.next());
            continue;
        }

        const std::uint32_t length = std::min(thisIter.peekLength(), otherIter.peekLength());
        Operation thisOp = thisIter.next(length);
        Operation otherOp = otherIter.next(length);

        if (otherOp.isRetain()) {
            const bool keepNull = thisOp.isRetain();
            AttributeMap attributes = AttributeMap::compose(thisOp.attributes, otherOp.attributes, keepNull);
            thisOp.attributes = std::move(attributes);
            out.push(std::move(thisOp));
        } else if (otherOp.isDelete() && thisOp.isRetain()) {
            out.push(std::move(otherOp));
        }
        // otherOp deletes content thisOp inserted: both vanish.
    }

    return out.chop();
}

Delta Delta::slice(std::uint32_t start, std::uint32_t end) const {
    Delta out;
    if (start >= end) {
        return out;
    }
    DeltaIterator it(*this);
    it.skip(start);
    std::uint32_t index = start;
    while (index < end && it.hasNext()) {
        Operation op = it.next(end - index);
        index += op.length;
        out.push(std::move(op));
    }
    return out;
}

// =============================================================================
// Queries
// =============================================================================

std::uint32_t Delta::length() const noexcept {
    std::uint32_t total = 0;
    for (const auto& op : ops_) {
        total += op.length;
    }
    return total;
}

bool Delta::isDocument() const noexcept {
    return std::all_of(ops_.begin(), ops_.end(), [](const Operation& op) { return op.isInsert(); });
}

} // namespace richdoc::delta
