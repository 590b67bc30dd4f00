#include "richdoc/delta/delta_iterator.h"
#include "richdoc/core/string_utils.h"
#include <algorithm>
#include <stdexcept>

namespace richdoc::delta {

DeltaIterator::DeltaIterator(const Delta& delta, DeltaCursor cursor)
    : delta_(delta), cursor_(cursor) {
    if (cursor_.opIndex > delta_.size()
        || (cursor_.opIndex < delta_.size() && cursor_.offset >= delta_[cursor_.opIndex].length)
        || (cursor_.opIndex == delta_.size() && cursor_.offset != 0)) {
        throw std::out_of_range("DeltaIterator cursor outside of delta");
    }
    if (cursor_.opIndex < delta_.size()) {
        const Operation& op = delta_[cursor_.opIndex];
        if (op.isTextInsert() && !isLogicalBoundary(op.text, cursor_.offset)) {
            throw std::out_of_range("DeltaIterator cursor inside a surrogate pair");
        }
    }
}

const Operation& DeltaIterator::current() const {
    if (!hasNext()) {
        throw std::out_of_range("DeltaIterator exhausted");
    }
    return delta_[cursor_.opIndex];
}

std::uint32_t DeltaIterator::peekLength() const {
    return current().length - cursor_.offset;
}

OpType DeltaIterator::peekType() const {
    return current().type;
}

Operation DeltaIterator::next() {
    return next(peekLength());
}

Operation DeltaIterator::next(std::uint32_t maxLength) {
    if (maxLength == 0) {
        throw std::invalid_argument("DeltaIterator::next requires a positive length");
    }
    const Operation& op = current();
    const std::uint32_t offset = cursor_.offset;
    const std::uint32_t remaining = op.length - offset;
    const std::uint32_t take = std::min(remaining, maxLength);

    // Slice before advancing so a rejected split leaves the cursor in place.
    Operation out = (offset == 0 && take == op.length) ? op : op.slice(offset, take);
    if (take == remaining) {
        ++cursor_.opIndex;
        cursor_.offset = 0;
    } else {
        cursor_.offset += take;
    }
    return out;
}

std::optional<Operation> DeltaIterator::skip(std::uint32_t length) {
    std::optional<Operation> last;
    std::uint32_t skipped = 0;
    while (skipped < length && hasNext()) {
        const std::uint32_t step = std::min(length - skipped, peekLength());
        last = next(step);
        skipped += step;
    }
    return last;
}

Delta DeltaIterator::rest() const {
    Delta out;
    if (!hasNext()) {
        return out;
    }
    DeltaIterator copy(delta_, cursor_);
    while (copy.hasNext()) {
        out.push(copy.next());
    }
    return out;
}

} // namespace richdoc::delta
