#pragma once
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

// Fixed-capacity FIFO over a single arena. Pushing into a full ring overwrites the
// oldest element. Storage grows only up to the number of elements actually pushed,
// so a large capacity costs nothing until it is used.
template <typename T>
class BoundedRing {
public:
    explicit BoundedRing(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("BoundedRing capacity must be positive");
    }

    size_t capacity() const { return capacity_; }
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == capacity_; }

    void push(T value) {
        if (slots_.size() < capacity_) {
            slots_.push_back(std::move(value));
            ++count_;
            return;
        }
        // head_ is the oldest slot once the arena is at capacity
        slots_[head_] = std::move(value);
        head_ = (head_ + 1) % capacity_;
    }

    // Index 0 is the oldest retained element.
    const T& at(size_t index) const {
        if (index >= count_) throw std::out_of_range("BoundedRing index out of range");
        return slots_[(head_ + index) % slots_.size()];
    }

    T& at(size_t index) {
        if (index >= count_) throw std::out_of_range("BoundedRing index out of range");
        return slots_[(head_ + index) % slots_.size()];
    }

private:
    std::vector<T> slots_;
    size_t capacity_;
    size_t head_ = 0;
    size_t count_ = 0;
};
