#ifndef RECPOOL_POOL_FLAT_OBJECT_POOL_H_
#define RECPOOL_POOL_FLAT_OBJECT_POOL_H_

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <glog/logging.h>
#include "common/errors.h"
#include "common/slice.h"

namespace Recpool {

// Half-open index range [begin, end) into a FlatObjectPool.
struct Range {
    size_t begin = 0;
    size_t end = 0;

    size_t Size() const { return end - begin; }
    bool Empty() const { return begin == end; }
};

inline bool operator==(const Range& a, const Range& b) {
    return a.begin == b.begin && a.end == b.end;
}

inline bool operator!=(const Range& a, const Range& b) {
    return !(a == b);
}

/**
 * FlatObjectPool is a fixed-capacity arena of T stored contiguously.
 * Callers hold (begin, end) index ranges, never pointers, so handles stay
 * valid for the arena's lifetime (the storage is never reallocated).
 *
 * Allocation:
 * - First-fit over the free-range list, in insertion order
 * - Otherwise bump allocation from the watermark
 * - CapacityExceeded when neither can serve the request
 *
 * The free-range list is bounded by range_capacity. A range released while the
 * list is full is lost for good; bookkeeping stays bounded instead.
 *
 * Range ownership is not tracked per slot. Positional access is checked
 * against the watermark only.
 */
template<typename T>
class FlatObjectPool {
public:
    /**
     * Constructor
     * @param buffer_size Number of slots in the arena (must be > 0)
     * @param range_capacity Maximum number of free ranges remembered
     */
    FlatObjectPool(size_t buffer_size, size_t range_capacity)
        : buffer_size_(buffer_size),
          range_capacity_(range_capacity) {
        if (buffer_size_ == 0) {
            throw std::invalid_argument("FlatObjectPool: buffer_size must be positive");
        }
        storage_.resize(buffer_size_);
        free_ranges_.reserve(range_capacity_);

        VLOG(1) << "FlatObjectPool initialized: " << buffer_size_ << " slots, "
                << range_capacity_ << " free-range entries";
    }

    FlatObjectPool(FlatObjectPool&&) = default;
    FlatObjectPool& operator=(FlatObjectPool&&) = default;

    /**
     * Acquire a contiguous range of n slots.
     * @return The acquired range. Acquire(0) returns an empty range at the
     *         watermark and allocates nothing.
     * @throws CapacityExceeded if no free range is large enough and the
     *         watermark cannot advance by n
     */
    Range Acquire(size_t n) {
        if (n == 0) {
            return Range{watermark_, watermark_};
        }

        for (auto it = free_ranges_.begin(); it != free_ranges_.end(); ++it) {
            if (it->Size() < n) continue;

            Range acquired{it->begin, it->begin + n};
            it->begin += n;
            if (it->Empty()) {
                free_ranges_.erase(it);
            }
            VLOG(3) << "FlatObjectPool::Acquire: reused [" << acquired.begin << ", "
                    << acquired.end << ")";
            return acquired;
        }

        size_t remaining = buffer_size_ - watermark_;
        if (n > remaining) {
            size_t largest_free = 0;
            for (const auto& r : free_ranges_) {
                largest_free = std::max(largest_free, r.Size());
            }
            VLOG(1) << "FlatObjectPool::Acquire: cannot serve " << n << " slots (watermark="
                    << watermark_ << ", buffer_size=" << buffer_size_
                    << ", largest_free=" << largest_free << ")";
            throw CapacityExceeded(n, std::max(remaining, largest_free));
        }

        Range acquired{watermark_, watermark_ + n};
        watermark_ += n;
        VLOG(3) << "FlatObjectPool::Acquire: bump [" << acquired.begin << ", "
                << acquired.end << ")";
        return acquired;
    }

    /**
     * Return [begin, end) to the pool. Slots are reset to T{}.
     * If the free-range list is full the range is not remembered.
     * @throws std::out_of_range if begin > end or end > watermark
     */
    void Release(size_t begin, size_t end) {
        CheckRange(begin, end, "Release");
        if (begin == end) {
            return;
        }

        std::fill(storage_.begin() + begin, storage_.begin() + end, T{});

        if (free_ranges_.size() >= range_capacity_) {
            VLOG(1) << "FlatObjectPool::Release: free-range list full (" << range_capacity_
                    << "), range [" << begin << ", " << end << ") is lost";
            return;
        }
        free_ranges_.push_back(Range{begin, end});
    }

    void Release(const Range& range) { Release(range.begin, range.end); }

    // Read-only view over [begin, end)
    Slice<const T> GetSlice(size_t begin, size_t end) const {
        CheckRange(begin, end, "GetSlice");
        return Slice<const T>(storage_.data() + begin, end - begin);
    }

    Slice<const T> GetSlice(const Range& range) const {
        return GetSlice(range.begin, range.end);
    }

    // Mutable view over [begin, end)
    Slice<T> GetSliceMut(size_t begin, size_t end) {
        CheckRange(begin, end, "GetSliceMut");
        return Slice<T>(storage_.data() + begin, end - begin);
    }

    void Set(size_t i, T value) {
        if (i >= watermark_) {
            throw std::out_of_range("FlatObjectPool::Set: index " + std::to_string(i) +
                                    " beyond watermark " + std::to_string(watermark_));
        }
        storage_[i] = std::move(value);
    }

    // nullptr if slot i was never assigned
    const T* Get(size_t i) const {
        if (i >= watermark_) {
            return nullptr;
        }
        return &storage_[i];
    }

    size_t BufferSize() const { return buffer_size_; }
    size_t Watermark() const { return watermark_; }
    size_t RangeCapacity() const { return range_capacity_; }

    // Number of ranges on the free list
    size_t AvailableCount() const { return free_ranges_.size(); }

private:
    void CheckRange(size_t begin, size_t end, const char* op) const {
        if (begin > end || end > watermark_) {
            throw std::out_of_range(std::string("FlatObjectPool::") + op + ": range [" +
                                    std::to_string(begin) + ", " + std::to_string(end) +
                                    ") outside assigned region [0, " +
                                    std::to_string(watermark_) + ")");
        }
    }

    size_t buffer_size_;
    size_t range_capacity_;
    size_t watermark_ = 0;
    std::vector<T> storage_;
    std::vector<Range> free_ranges_;

    FlatObjectPool(const FlatObjectPool&) = delete;
    FlatObjectPool& operator=(const FlatObjectPool&) = delete;
};

} // namespace Recpool

#endif // RECPOOL_POOL_FLAT_OBJECT_POOL_H_
