#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

// Lock-free single-producer single-consumer byte ring.
// Producer (event loop, via RecognitionEngine::process_audio) calls write().
// Consumer (engine worker thread) calls read() / drain_samples().
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_bytes)
        : buf_(capacity_bytes), capacity_(capacity_bytes) {}

    // Producer: all-or-nothing write. Returns false (and writes nothing) when
    // the frame does not fit, so a partially queued chunk never reaches the engine.
    bool write(const void* data, size_t len) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        if (len > capacity_ - (w - r)) return false;
        if (len == 0) return true;

        auto src = static_cast<const uint8_t*>(data);
        size_t offset = w % capacity_;
        size_t first = std::min(len, capacity_ - offset);
        std::memcpy(buf_.data() + offset, src, first);
        if (first < len) {
            std::memcpy(buf_.data(), src + first, len - first);
        }

        write_pos_.store(w + len, std::memory_order_release);
        return true;
    }

    // Consumer: read up to max_len bytes. Returns bytes actually read.
    size_t read(void* dest, size_t max_len) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(max_len, w - r);
        if (to_read == 0) return 0;

        auto dst = static_cast<uint8_t*>(dest);
        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::memcpy(dst, buf_.data() + offset, first);
        if (first < to_read) {
            std::memcpy(dst + first, buf_.data(), to_read - first);
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer: append every complete int16_t sample to `out`. An odd trailing
    // byte stays queued until its partner arrives with the next frame.
    size_t drain_samples(std::vector<int16_t>& out) {
        size_t avail = available() & ~size_t(1);
        if (avail == 0) return 0;

        size_t old_size = out.size();
        out.resize(old_size + avail / sizeof(int16_t));
        read(out.data() + old_size, avail);
        return avail / sizeof(int16_t);
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }

    // Only safe while neither side is active (engine stopped).
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<uint8_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
};
