#ifndef RECPOOL_POOL_RECORD_SEQUENCE_H_
#define RECPOOL_POOL_RECORD_SEQUENCE_H_

#include <cstddef>
#include <vector>
#include "common/record.h"
#include "common/slice.h"
#include "flat_object_pool.h"

namespace Recpool {

/**
 * RecordSequence is an append-only, step-tracked history of records backed
 * by a FlatObjectPool<Record>.
 *
 * AddPoint()/AddPoints() stage records in the arena; Update() commits
 * everything staged so far and advances the step counter. Current() only ever
 * shows the committed prefix [0, committed_end), in append order.
 *
 * Ranges are never released back to the arena, so every staged range is
 * bump-allocated directly after the previous one.
 */
class RecordSequence {
public:
    /**
     * @param buffer_size Maximum number of records the sequence can ever hold
     * @param range_capacity Free-range bookkeeping of the underlying arena
     */
    RecordSequence(size_t buffer_size, size_t range_capacity);

    /**
     * Stage one record.
     * @throws CapacityExceeded if the arena is full
     */
    void AddPoint(const Record& record);

    /**
     * Stage several records, preserving their order. Nothing is staged if the
     * arena cannot hold all of them.
     * @throws CapacityExceeded if the arena cannot hold all records
     */
    void AddPoints(const std::vector<Record>& records);

    // Commit staged records and advance the step counter.
    void Update();

    // Committed history. Invalidated by the next Update().
    Slice<const Record> Current() const;

    // Number of completed Update() calls
    size_t Step() const { return step_; }

    // Committed length
    size_t Size() const { return committed_end_; }
    bool Empty() const { return committed_end_ == 0; }

    // Records written but not yet committed
    size_t Staged() const { return staged_end_ - committed_end_; }

    size_t Capacity() const { return arena_.BufferSize(); }

    // Free ranges held by the arena; stays zero for an append-only sequence.
    size_t ArenaFreeRanges() const { return arena_.AvailableCount(); }

private:
    Range Stage(size_t n);

    FlatObjectPool<Record> arena_;
    size_t committed_end_ = 0;
    size_t staged_end_ = 0;
    size_t step_ = 0;
};

} // namespace Recpool

#endif // RECPOOL_POOL_RECORD_SEQUENCE_H_
