#include "metasplice/splice.h"

#include <algorithm>

namespace metasplice {

void
SpliceEdit::reserve_ops(size_t count)
{
    ops_.reserve(count);
}


void
SpliceEdit::push(SpliceOpKind kind, uint64_t offset, uint64_t length,
                 std::span<const std::byte> bytes)
{
    SpliceOp op;
    op.kind        = kind;
    op.offset      = offset;
    op.length      = length;
    op.data_offset = pool_.size();
    op.data_size   = bytes.size();
    op.seq         = static_cast<uint32_t>(ops_.size());
    pool_.insert(pool_.end(), bytes.begin(), bytes.end());
    ops_.push_back(op);
}


void
SpliceEdit::insert(uint64_t offset, std::span<const std::byte> bytes)
{
    push(SpliceOpKind::Insert, offset, 0, bytes);
}


void
SpliceEdit::remove(uint64_t offset, uint64_t length)
{
    push(SpliceOpKind::Remove, offset, length, {});
}


void
SpliceEdit::replace(uint64_t offset, uint64_t length,
                    std::span<const std::byte> bytes)
{
    push(SpliceOpKind::Replace, offset, length, bytes);
}


std::span<const SpliceOp>
SpliceEdit::ops() const noexcept
{
    return std::span<const SpliceOp>(ops_.data(), ops_.size());
}


std::span<const std::byte>
SpliceEdit::op_bytes(const SpliceOp& op) const noexcept
{
    if (op.data_size == 0U) {
        return {};
    }
    return std::span<const std::byte>(pool_.data() + op.data_offset,
                                      static_cast<size_t>(op.data_size));
}


int64_t
SpliceEdit::size_delta() const noexcept
{
    int64_t delta = 0;
    for (const SpliceOp& op : ops_) {
        delta += static_cast<int64_t>(op.data_size);
        delta -= static_cast<int64_t>(op.length);
    }
    return delta;
}


uint64_t
SpliceEdit::map_offset(uint64_t original) const noexcept
{
    int64_t delta = 0;
    for (const SpliceOp& op : ops_) {
        const bool before = op.offset < original
                            || (op.offset == original && op.length == 0U);
        if (before && op.offset + op.length <= original) {
            delta += static_cast<int64_t>(op.data_size);
            delta -= static_cast<int64_t>(op.length);
        }
    }
    return static_cast<uint64_t>(static_cast<int64_t>(original) + delta);
}

namespace {

    static bool op_before(const SpliceOp& a, const SpliceOp& b) noexcept
    {
        if (a.offset != b.offset) {
            return a.offset < b.offset;
        }
        const bool a_insert = a.length == 0U;
        const bool b_insert = b.length == 0U;
        if (a_insert != b_insert) {
            return a_insert;
        }
        return a.seq < b.seq;
    }

}  // namespace

SpliceStatus
commit_splice(std::span<const std::byte> base, const SpliceEdit& edit,
              std::vector<std::byte>* out)
{
    out->clear();

    std::vector<SpliceOp> ops(edit.ops().begin(), edit.ops().end());
    std::sort(ops.begin(), ops.end(), &op_before);

    const uint64_t size = base.size();
    for (const SpliceOp& op : ops) {
        if (op.offset > size || op.length > size - op.offset) {
            return SpliceStatus::OutOfRange;
        }
    }

    uint64_t cursor = 0;
    const int64_t projected = static_cast<int64_t>(size) + edit.size_delta();
    out->reserve(static_cast<size_t>(projected > 0 ? projected : 0));

    for (const SpliceOp& op : ops) {
        if (op.offset < cursor) {
            out->clear();
            return SpliceStatus::Overlap;
        }
        out->insert(out->end(), base.begin() + static_cast<ptrdiff_t>(cursor),
                    base.begin() + static_cast<ptrdiff_t>(op.offset));
        const std::span<const std::byte> data = edit.op_bytes(op);
        out->insert(out->end(), data.begin(), data.end());
        cursor = op.offset + op.length;
    }
    out->insert(out->end(), base.begin() + static_cast<ptrdiff_t>(cursor),
                base.end());
    return SpliceStatus::Ok;
}

}  // namespace metasplice
