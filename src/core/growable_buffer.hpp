#pragma once

#include <cstddef>
#include <string>
#include <vector>

// ── Growth policy ───────────────────────────────────────────
constexpr std::size_t BUFFER_INITIAL_CAPACITY = 128;
constexpr std::size_t BUFFER_MIN_HEADROOM     = 1024;    // grow when fewer bytes remain
constexpr std::size_t BUFFER_MAX_INCREMENT    = 65536;   // never add more than this per growth

// Byte buffer filled in place by non-blocking reads.
//
// One byte of capacity is always kept free for the terminator, so the logical
// length stays strictly below the capacity. After each append the buffer
// doubles (by at most BUFFER_MAX_INCREMENT) when the headroom drops below
// BUFFER_MIN_HEADROOM.
class GrowableBuffer {
public:
    GrowableBuffer();

    // Where the next read should land, and how much it may write.
    char* write_ptr() { return storage_.data() + length_; }
    std::size_t writable() const { return storage_.size() - length_ - 1; }

    // Commit n bytes written at write_ptr().
    void advance(std::size_t n);

    std::size_t size() const { return length_; }
    std::size_t capacity() const { return storage_.size(); }
    std::size_t growth_count() const { return growths_; }

    // Shrink to the exact length and hand the bytes over. Leaves the buffer empty.
    std::string finish();

private:
    std::vector<char> storage_;
    std::size_t length_ = 0;
    std::size_t growths_ = 0;

    void grow_if_needed();
};
