#ifndef RECPOOL_POOL_OBJECT_POOL_H_
#define RECPOOL_POOL_OBJECT_POOL_H_

#include <cstddef>
#include <deque>
#include <utility>
#include <vector>
#include <glog/logging.h>

namespace Recpool {

/**
 * ObjectPool recycles growable sequences (std::vector<T>) so that a
 * producer/consumer loop does not reallocate on every step.
 *
 * Design:
 * - Idle sequences are kept on a LIFO free list (most recently released first,
 *   warmest in cache)
 * - Sequences are cleared on release; their capacity is retained
 * - The free list holds at most pool_capacity sequences; a release into a full
 *   list evicts (deallocates) the oldest idle sequence so the warmest ones stay
 * - Not thread-safe: one owner at a time
 */
template<typename T>
class ObjectPool {
public:
    /**
     * Constructor
     * @param pool_capacity Maximum number of idle sequences retained.
     *                      0 means never retain (always allocate fresh).
     */
    explicit ObjectPool(size_t pool_capacity)
        : pool_capacity_(pool_capacity) {}

    ObjectPool(ObjectPool&&) = default;
    ObjectPool& operator=(ObjectPool&&) = default;

    /**
     * Take a sequence from the pool, or a new one if the pool is empty.
     * The returned sequence is always empty.
     */
    std::vector<T> Acquire() {
        if (free_list_.empty()) {
            VLOG(3) << "ObjectPool::Acquire: free list empty, allocating";
            return std::vector<T>();
        }
        std::vector<T> seq = std::move(free_list_.back());
        free_list_.pop_back();
        VLOG(3) << "ObjectPool::Acquire: reused sequence (capacity="
                << seq.capacity() << ", available=" << free_list_.size() << ")";
        return seq;
    }

    /**
     * Return a sequence to the pool. The sequence is cleared first.
     * With pool_capacity 0 it is simply dropped; otherwise, if the free list is
     * full, the oldest idle sequence is dropped to make room.
     */
    void Release(std::vector<T> seq) {
        seq.clear();
        if (pool_capacity_ == 0) {
            VLOG(2) << "ObjectPool::Release: zero capacity, dropping sequence";
            return;
        }
        if (free_list_.size() >= pool_capacity_) {
            VLOG(2) << "ObjectPool::Release: free list full (" << pool_capacity_
                    << "), dropping oldest sequence of capacity "
                    << free_list_.front().capacity();
            free_list_.pop_front();
        }
        free_list_.push_back(std::move(seq));
    }

    size_t AvailableCount() const { return free_list_.size(); }

    size_t Capacity() const { return pool_capacity_; }

private:
    size_t pool_capacity_;
    std::deque<std::vector<T>> free_list_;   // back = most recently released

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;
};

} // namespace Recpool

#endif // RECPOOL_POOL_OBJECT_POOL_H_
