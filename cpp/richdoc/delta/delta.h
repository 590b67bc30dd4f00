#ifndef RICHDOC_DELTA_DELTA_H
#define RICHDOC_DELTA_DELTA_H

#include "richdoc/delta/operation.h"
#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

namespace richdoc::delta {

/**
 * Delta: an ordered, normalized list of operations.
 *
 * A Delta made only of inserts is a document snapshot; one with retains or
 * deletes is a patch. Every mutation goes through push(), which keeps the
 * list normalized:
 * - zero-length operations are dropped;
 * - adjacent deletes are merged;
 * - an insert pushed right after a delete is placed before it;
 * - adjacent text inserts, or adjacent retains, with equal attributes merge.
 */
class Delta {
public:
    using const_iterator = std::vector<Operation>::const_iterator;

    static constexpr std::uint32_t kEnd = std::numeric_limits<std::uint32_t>::max();

    Delta() = default;
    explicit Delta(const std::vector<Operation>& ops);

    // ==========================================================================
    // Builders
    // ==========================================================================

    Delta& insert(std::string_view text, AttributeMap attributes = {});
    Delta& insert(Embed embed, AttributeMap attributes = {});
    Delta& retain(std::uint32_t length, AttributeMap attributes = {});
    Delta& remove(std::uint32_t length);
    Delta& push(Operation op);

    /**
     * Drop a trailing retain that carries no attributes.
     */
    Delta& chop();

    // ==========================================================================
    // Algebra
    // ==========================================================================

    /**
     * This Delta followed by `other`, merging at the seam.
     */
    Delta concat(const Delta& other) const;

    /**
     * The result of applying patch `other` on top of this Delta.
     */
    Delta compose(const Delta& other) const;

    /**
     * Operations covering logical range [start, end).
     */
    Delta slice(std::uint32_t start, std::uint32_t end = kEnd) const;

    // ==========================================================================
    // Queries
    // ==========================================================================

    std::uint32_t length() const noexcept;
    bool isDocument() const noexcept;

    bool empty() const noexcept { return ops_.empty(); }
    std::size_t size() const noexcept { return ops_.size(); }
    const Operation& operator[](std::size_t i) const { return ops_[i]; }
    const Operation& back() const { return ops_.back(); }
    const std::vector<Operation>& ops() const noexcept { return ops_; }
    const_iterator begin() const noexcept { return ops_.begin(); }
    const_iterator end() const noexcept { return ops_.end(); }

    bool operator==(const Delta& other) const { return ops_ == other.ops_; }
    bool operator!=(const Delta& other) const { return !(*this == other); }

private:
    std::vector<Operation> ops_;
};

} // namespace richdoc::delta

#endif // RICHDOC_DELTA_DELTA_H
