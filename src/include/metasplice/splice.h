#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file splice.h
 * \brief Range edits over an immutable byte buffer.
 */

namespace metasplice {

enum class SpliceOpKind : uint8_t {
    Insert,
    Remove,
    Replace,
};

/// A single range operation recorded by \ref SpliceEdit.
struct SpliceOp final {
    SpliceOpKind kind = SpliceOpKind::Insert;
    /// Offset in the original buffer.
    uint64_t offset = 0;
    /// Original bytes covered (0 for inserts).
    uint64_t length = 0;
    /// New bytes, stored in the edit's byte pool.
    uint64_t data_offset = 0;
    uint64_t data_size   = 0;
    /// Recording order; breaks ties between inserts at one offset.
    uint32_t seq = 0;
};

enum class SpliceStatus : uint8_t {
    Ok,
    /// An operation reaches past the end of the base buffer.
    OutOfRange,
    /// Two operations cover overlapping original bytes.
    Overlap,
};

/**
 * \brief A batch of range edits against one original buffer.
 *
 * Operations are recorded without touching the original and applied with
 * \ref commit_splice. Offsets always refer to the original buffer. Inserts at
 * the same offset land in recording order, before any removal starting
 * there; inserted bytes are copied into the edit.
 */
class SpliceEdit final {
public:
    SpliceEdit() = default;

    void reserve_ops(size_t count);

    void insert(uint64_t offset, std::span<const std::byte> bytes);
    void remove(uint64_t offset, uint64_t length);
    void replace(uint64_t offset, uint64_t length,
                 std::span<const std::byte> bytes);

    std::span<const SpliceOp> ops() const noexcept;
    std::span<const std::byte> op_bytes(const SpliceOp& op) const noexcept;
    bool empty() const noexcept { return ops_.empty(); }

    /// Output size minus input size once all operations are applied.
    int64_t size_delta() const noexcept;

    /**
     * \brief Maps an original offset to its position in the output.
     *
     * Meaningful for offsets outside every removed range. Inserts recorded at
     * exactly \p original shift it.
     */
    uint64_t map_offset(uint64_t original) const noexcept;

private:
    void push(SpliceOpKind kind, uint64_t offset, uint64_t length,
              std::span<const std::byte> bytes);

    std::vector<std::byte> pool_;
    std::vector<SpliceOp> ops_;
};

/**
 * \brief Applies \p edit to \p base, writing the complete result into \p out.
 *
 * Every byte not covered by an operation is copied unchanged and in order.
 * On failure \p out is cleared.
 */
SpliceStatus
commit_splice(std::span<const std::byte> base, const SpliceEdit& edit,
              std::vector<std::byte>* out);

}  // namespace metasplice
