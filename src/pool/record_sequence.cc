#include "record_sequence.h"

#include <stdexcept>
#include <string>
#include <glog/logging.h>

namespace Recpool {

RecordSequence::RecordSequence(size_t buffer_size, size_t range_capacity)
    : arena_(buffer_size, range_capacity) {
    VLOG(1) << "RecordSequence initialized: capacity=" << buffer_size;
}

Range RecordSequence::Stage(size_t n) {
    Range range = arena_.Acquire(n);

    // History must stay contiguous; a range anywhere else would reorder it.
    if (range.begin != staged_end_) {
        LOG(ERROR) << "RecordSequence: staged range [" << range.begin << ", " << range.end
                   << ") does not follow staged end " << staged_end_;
        throw std::logic_error("RecordSequence: non-contiguous staged range at " +
                               std::to_string(range.begin) + ", expected " +
                               std::to_string(staged_end_));
    }
    staged_end_ = range.end;
    return range;
}

void RecordSequence::AddPoint(const Record& record) {
    Range range = Stage(1);
    arena_.Set(range.begin, record);
}

void RecordSequence::AddPoints(const std::vector<Record>& records) {
    if (records.empty()) {
        return;
    }
    Range range = Stage(records.size());
    Slice<Record> slots = arena_.GetSliceMut(range.begin, range.end);
    for (size_t i = 0; i < records.size(); ++i) {
        slots[i] = records[i];
    }
}

void RecordSequence::Update() {
    committed_end_ = staged_end_;
    ++step_;
    VLOG(2) << "RecordSequence::Update: step=" << step_ << ", committed=" << committed_end_;
}

Slice<const Record> RecordSequence::Current() const {
    return arena_.GetSlice(0, committed_end_);
}

} // namespace Recpool
