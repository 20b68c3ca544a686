#ifndef RECPOOL_POOL_DOUBLE_BUFFER_H_
#define RECPOOL_POOL_DOUBLE_BUFFER_H_

#include <cstddef>
#include <utility>
#include <vector>
#include <glog/logging.h>
#include "object_pool.h"

namespace Recpool {

/**
 * DoubleBuffer keeps a committed front sequence for readers and a back
 * sequence for the writer. Swap() is the commit point.
 *
 * Both sequences come from an owned ObjectPool, so steady-state swapping
 * reuses the same allocations.
 */
template<typename T>
class DoubleBuffer {
public:
    explicit DoubleBuffer(size_t pool_capacity)
        : pool_(pool_capacity),
          front_(pool_.Acquire()),
          back_(pool_.Acquire()) {}

    // Back buffer for the writer. Invalidated by Swap().
    std::vector<T>& BackMut() { return back_; }

    // Last committed data. Stable until the next Swap().
    const std::vector<T>& Front() const { return front_; }

    /**
     * Commit the back buffer.
     * The old front goes back to the pool, the back becomes the front and a
     * freshly acquired (empty) sequence becomes the back.
     */
    void Swap() {
        pool_.Release(std::move(front_));
        front_ = std::move(back_);
        back_ = pool_.Acquire();
        ++step_;
        VLOG(2) << "DoubleBuffer::Swap: step=" << step_ << ", front=" << front_.size()
                << ", pool_available=" << pool_.AvailableCount();
    }

    // Empties both buffers, keeping their capacity.
    void Clear() {
        front_.clear();
        back_.clear();
    }

    size_t PoolAvailable() const { return pool_.AvailableCount(); }

    // Number of completed swaps.
    size_t Step() const { return step_; }

private:
    ObjectPool<T> pool_;
    std::vector<T> front_;
    std::vector<T> back_;
    size_t step_ = 0;

    DoubleBuffer(const DoubleBuffer&) = delete;
    DoubleBuffer& operator=(const DoubleBuffer&) = delete;
};

} // namespace Recpool

#endif // RECPOOL_POOL_DOUBLE_BUFFER_H_
