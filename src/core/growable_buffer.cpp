#include "growable_buffer.hpp"
#include <algorithm>
#include <stdexcept>

GrowableBuffer::GrowableBuffer() : storage_(BUFFER_INITIAL_CAPACITY) {}

void GrowableBuffer::advance(std::size_t n) {
    if (n > writable()) {
        throw std::length_error("GrowableBuffer: advance past writable region");
    }
    length_ += n;
    grow_if_needed();
}

void GrowableBuffer::grow_if_needed() {
    std::size_t cap = storage_.size();
    if (cap - length_ >= BUFFER_MIN_HEADROOM) return;

    std::size_t new_cap = std::min(cap * 2, cap + BUFFER_MAX_INCREMENT);
    storage_.resize(new_cap);
    ++growths_;
}

std::string GrowableBuffer::finish() {
    std::string out(storage_.data(), length_);
    storage_.assign(BUFFER_INITIAL_CAPACITY, '\0');
    storage_.shrink_to_fit();
    length_ = 0;
    growths_ = 0;
    return out;
}
