#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace oralsense {

// Fixed-capacity ring buffer. Pushing into a full buffer overwrites the oldest value.
template <typename T>
class CircularBuffer {
public:
    CircularBuffer() : CircularBuffer(1) {}
    explicit CircularBuffer(size_t cap) {
        if (cap == 0) cap = 1;
        buf_.assign(cap, T{});
        cap_ = cap;
    }

    size_t capacity() const { return cap_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == cap_; }

    inline void push_back(const T& v) {
        if (size_ < cap_) {
            buf_[(head_ + size_) % cap_] = v;
            ++size_;
        } else {
            buf_[head_] = v;
            head_ = (head_ + 1) % cap_;
        }
    }

    // i-th element from oldest (0..size-1)
    inline const T& at(size_t i) const { return buf_[(head_ + i) % cap_]; }
    // i-th element from newest (0 == most recent)
    inline const T& fromNewest(size_t i) const { return at(size_ - 1 - i); }
    const T& back() const { return at(size_ - 1); }

    void clear() {
        std::fill(buf_.begin(), buf_.end(), T{});
        head_ = 0;
        size_ = 0;
    }

    // Snapshot into contiguous vector (oldest..newest)
    void snapshot(std::vector<T>& out) const {
        out.resize(size_);
        if (size_ == 0) return;
        size_t first = head_;
        size_t n1 = std::min(size_, cap_ - first);
        for (size_t i = 0; i < n1; ++i) out[i] = buf_[first + i];
        for (size_t i = n1; i < size_; ++i) out[i] = buf_[i - n1];
    }

    std::vector<T> snapshot() const {
        std::vector<T> out;
        snapshot(out);
        return out;
    }

    // Newest n values (oldest..newest); fewer when the buffer holds less
    void tail(size_t n, std::vector<T>& out) const {
        n = std::min(n, size_);
        out.resize(n);
        const size_t skip = size_ - n;
        for (size_t i = 0; i < n; ++i) out[i] = at(skip + i);
    }

private:
    std::vector<T> buf_;
    size_t cap_ {0};
    size_t head_ {0};
    size_t size_ {0};
};

} // namespace oralsense
