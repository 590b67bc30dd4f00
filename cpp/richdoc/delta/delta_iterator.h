#ifndef RICHDOC_DELTA_DELTA_ITERATOR_H
#define RICHDOC_DELTA_DELTA_ITERATOR_H

#include "richdoc/delta/delta.h"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace richdoc::delta {

// Position inside a Delta: operation index plus offset into that operation.
struct DeltaCursor {
    std::size_t opIndex = 0;
    std::uint32_t offset = 0;

    bool operator==(const DeltaCursor& other) const { return opIndex == other.opIndex && offset == other.offset; }
    bool operator!=(const DeltaCursor& other) const { return !(*this == other); }
};

/**
 * DeltaIterator: forward cursor over a Delta that splits operations on demand.
 *
 * The iterator borrows the Delta; it must not outlive it and the Delta must
 * not change while it is traversed. The position is a plain DeltaCursor value
 * which can be read back with cursor() and used to start another iterator.
 *
 * Reading past the end (next/peek with hasNext() == false) throws
 * std::out_of_range.
 */
class DeltaIterator {
public:
    explicit DeltaIterator(const Delta& delta, DeltaCursor cursor = {});
    DeltaIterator(Delta&&, DeltaCursor = {}) = delete;

    bool hasNext() const noexcept { return cursor_.opIndex < delta_.size(); }

    // Remaining length of the current operation.
    std::uint32_t peekLength() const;
    OpType peekType() const;

    /**
     * The whole remainder of the current operation.
     */
    Operation next();

    /**
     * At most maxLength units of the current operation. The operation is
     * split when it is longer; the rest stays pending. maxLength must be > 0.
     * A split inside a surrogate pair throws std::invalid_argument and does
     * not advance.
     */
    Operation next(std::uint32_t maxLength);

    /**
     * Advance by exactly `length` units (or to the end, whichever comes
     * first). Returns the last, possibly partial, operation consumed, or
     * nullopt when nothing was consumed.
     */
    std::optional<Operation> skip(std::uint32_t length);

    /**
     * Everything not consumed yet, as a Delta. Does not advance.
     */
    Delta rest() const;

    DeltaCursor cursor() const noexcept { return cursor_; }

private:
    const Operation& current() const;

    const Delta& delta_;
    DeltaCursor cursor_;
};

} // namespace richdoc::delta

#endif // RICHDOC_DELTA_DELTA_ITERATOR_H
