#ifndef RECPOOL_COMMON_SLICE_H_
#define RECPOOL_COMMON_SLICE_H_

#include <cstddef>

namespace Recpool {

// Non-owning view over contiguous elements held by a pool, arena or sequence.
// A view is only valid until the next mutating call on its owner.
template<typename T>
class Slice {
public:
    Slice(T* data, size_t size)
        : data_(data), size_(size) {}

    size_t Size() const { return size_; }
    bool Empty() const { return size_ == 0; }

    T& operator[](size_t i) const { return data_[i]; }

    T* begin() const { return data_; }
    T* end() const { return data_ + size_; }

private:
    T* data_;
    size_t size_;
};

} // namespace Recpool

#endif // RECPOOL_COMMON_SLICE_H_
