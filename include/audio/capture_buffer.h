#ifndef VOXCAP_AUDIO_CAPTURE_BUFFER_H
#define VOXCAP_AUDIO_CAPTURE_BUFFER_H

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace voxcap::audio {

// Lock-free session buffer (single producer / single consumer) for processed mono samples.
//
// Usage:
//   CaptureBuffer buffer;
//   buffer.init(maxSeconds * targetRate);
//   buffer.append(data, count);   // audio callback, once per callback
//   buffer.drain(out);            // control path, after capture has stopped
//
// Memory ordering / invariants:
//   - Producer is the sole writer of tail_, consumer the sole writer of head_.
//   - size_ is the synchronization point: sample writes happen-before
//     size_.fetch_add(release); size_.load(acquire) happens-before sample reads.
//   - init()/clear() only while neither side is running.
//   - When capacity runs out the overflow is dropped (never blocks) and full() latches
//     until clear().
class CaptureBuffer {
   public:
    CaptureBuffer() = default;
    CaptureBuffer(const CaptureBuffer&) = delete;
    CaptureBuffer& operator=(const CaptureBuffer&) = delete;

    void init(size_t capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("CaptureBuffer capacity must be > 0");
        }
        buffer_.assign(capacity, 0.0f);
        clear();
    }

    size_t capacity() const {
        return buffer_.size();
    }

    size_t size() const {
        return size_.load(std::memory_order_acquire);
    }

    bool empty() const {
        return size() == 0;
    }

    bool full() const {
        return full_.load(std::memory_order_acquire);
    }

    size_t droppedSamples() const {
        return dropped_.load(std::memory_order_relaxed);
    }

    // Producer side. Returns the number of samples stored; the rest is dropped.
    size_t append(const float* data, size_t count) {
        size_t cap = capacity();
        if (cap == 0 || count == 0) {
            return 0;
        }
        size_t space = cap - size_.load(std::memory_order_acquire);
        size_t accepted = std::min(count, space);
        if (accepted < count) {
            dropped_.fetch_add(count - accepted, std::memory_order_relaxed);
            full_.store(true, std::memory_order_release);
        }
        if (accepted == 0) {
            return 0;
        }

        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t first = std::min(accepted, cap - tail);
        std::memcpy(buffer_.data() + tail, data, first * sizeof(float));
        if (accepted > first) {
            std::memcpy(buffer_.data(), data + first, (accepted - first) * sizeof(float));
        }
        tail_.store((tail + accepted) % cap, std::memory_order_relaxed);
        size_.fetch_add(accepted, std::memory_order_release);
        if (accepted == space) {
            full_.store(true, std::memory_order_release);
        }
        return accepted;
    }

    // Consumer side. Appends everything currently stored to out.
    size_t drain(std::vector<float>& out) {
        size_t cap = capacity();
        size_t count = size_.load(std::memory_order_acquire);
        if (cap == 0 || count == 0) {
            return 0;
        }
        size_t head = head_.load(std::memory_order_relaxed);
        size_t first = std::min(count, cap - head);
        out.insert(out.end(), buffer_.begin() + static_cast<long>(head),
                   buffer_.begin() + static_cast<long>(head + first));
        if (count > first) {
            out.insert(out.end(), buffer_.begin(),
                       buffer_.begin() + static_cast<long>(count - first));
        }
        head_.store((head + count) % cap, std::memory_order_relaxed);
        size_.fetch_sub(count, std::memory_order_release);
        return count;
    }

    std::vector<float> drainAll() {
        std::vector<float> out;
        out.reserve(size());
        drain(out);
        return out;
    }

    void clear() {
        head_.store(0, std::memory_order_relaxed);
        tail_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
        full_.store(false, std::memory_order_relaxed);
        size_.store(0, std::memory_order_release);
    }

   private:
    std::vector<float> buffer_;
    std::atomic<size_t> head_{0};  // read position (consumer updates)
    std::atomic<size_t> tail_{0};  // write position (producer updates)
    std::atomic<size_t> size_{0};  // samples stored
    std::atomic<size_t> dropped_{0};
    std::atomic<bool> full_{false};
};

}  // namespace voxcap::audio

#endif  // VOXCAP_AUDIO_CAPTURE_BUFFER_H
