#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "AudioError.h"
#include "AudioFormat.h"

struct RingBufferConfig {
    static constexpr double kMinDurationSeconds = 0.1;
    static constexpr double kMaxDurationSeconds = 30.0;
    static constexpr size_t kMaxBytes = 100u * 1024u * 1024u;

    double      bufferDurationSeconds = 2.5;
    AudioFormat format;
    bool        allowOverwrite = false;
    double      underrunThreshold = 0.1;   // fraction of capacity

    // Validating constructor; nullopt (and *error filled) when out of bounds
    static std::optional<RingBufferConfig> create(double durationSeconds,
                                                  const AudioFormat& format,
                                                  bool allowOverwrite,
                                                  AudioError* error = nullptr);

    static RingBufferConfig lowLatency(const AudioFormat& format);   // 0.5 s
    static RingBufferConfig standard(const AudioFormat& format);     // 2.5 s
    static RingBufferConfig highLatency(const AudioFormat& format);  // 4.5 s

    size_t totalSamples() const;
    size_t bufferSizeBytes() const { return totalSamples() * sizeof(double); }

    std::optional<AudioError> validate() const;
};

struct RingBufferHealth {
    double   utilization   = 0.0;
    size_t   availableRead = 0;
    uint64_t underrunCount = 0;
    bool     underrun      = false;   // below the configured threshold
};

class RingBufferProducer;
class RingBufferConsumer;

// Fixed-capacity SPSC ring of canonical samples.
//
// One slot is always left empty so that full and empty are distinguishable:
// availableRead() + availableWrite() == capacity() - 1 at all times.
//
// Thread safety: exactly one thread writes through the producer and exactly
// one thread reads through the consumer. Cursor loads are acquire and cursor
// stores release, so a reader that observes a new write position also
// observes the samples written before it. No locks, no allocation after
// create().
class AudioRingBuffer {
public:
    using Handles = std::pair<RingBufferProducer, RingBufferConsumer>;

    static std::optional<Handles> create(const RingBufferConfig& config,
                                         AudioError* error = nullptr);

    AudioRingBuffer(const AudioRingBuffer&) = delete;
    AudioRingBuffer& operator=(const AudioRingBuffer&) = delete;

    size_t capacity() const { return m_capacity; }
    const AudioFormat& format() const { return m_format; }
    bool allowOverwrite() const { return m_allowOverwrite; }

    size_t availableRead() const;
    size_t availableWrite() const { return m_capacity - availableRead() - 1; }
    bool isEmpty() const { return availableRead() == 0; }
    bool isFull() const { return availableWrite() == 0; }
    double utilization() const { return (double)availableRead() / (double)m_capacity; }

    bool isUnderrun(double threshold) const;
    uint64_t underrunCount() const { return m_underrunCount.load(std::memory_order_relaxed); }
    RingBufferHealth checkHealth() const;

private:
    explicit AudioRingBuffer(const RingBufferConfig& config);

    size_t distance(size_t from, size_t to) const {
        return to >= from ? to - from : m_capacity - from + to;
    }

    // Two-segment copies split at the end of the backing store
    void copyIn(size_t pos, const double* src, size_t count);
    void copyOut(size_t pos, double* dst, size_t count) const;

    friend class RingBufferProducer;
    friend class RingBufferConsumer;

    std::vector<double>   m_buffer;
    const size_t          m_capacity;
    const AudioFormat     m_format;
    const bool            m_allowOverwrite;
    const double          m_underrunThreshold;
    std::atomic<size_t>   m_writePos{0};
    std::atomic<size_t>   m_readPos{0};
    std::atomic<uint64_t> m_underrunCount{0};
};

class RingBufferProducer {
public:
    RingBufferProducer(RingBufferProducer&&) noexcept = default;
    RingBufferProducer& operator=(RingBufferProducer&&) noexcept = default;
    RingBufferProducer(const RingBufferProducer&) = delete;
    RingBufferProducer& operator=(const RingBufferProducer&) = delete;

    // Copies min(count, availableWrite()) samples. Never blocks.
    size_t write(const double* samples, size_t count);
    size_t write(const std::vector<double>& samples) { return write(samples.data(), samples.size()); }

    // Writes up to capacity() - 1 samples, discarding the oldest unread
    // samples when free space runs out.
    size_t writeOverwrite(const double* samples, size_t count);
    size_t writeOverwrite(const std::vector<double>& samples) { return writeOverwrite(samples.data(), samples.size()); }

    size_t availableWrite() const { return m_ring->availableWrite(); }
    bool isFull() const { return m_ring->isFull(); }
    size_t capacity() const { return m_ring->capacity(); }
    const AudioRingBuffer& ring() const { return *m_ring; }

private:
    explicit RingBufferProducer(std::shared_ptr<AudioRingBuffer> ring) : m_ring(std::move(ring)) {}
    friend class AudioRingBuffer;

    std::shared_ptr<AudioRingBuffer> m_ring;
};

class RingBufferConsumer {
public:
    RingBufferConsumer(RingBufferConsumer&&) noexcept = default;
    RingBufferConsumer& operator=(RingBufferConsumer&&) noexcept = default;
    RingBufferConsumer(const RingBufferConsumer&) = delete;
    RingBufferConsumer& operator=(const RingBufferConsumer&) = delete;

    size_t read(double* output, size_t count);
    size_t read(std::vector<double>& output) { return read(output.data(), output.size()); }

    // Always fills all of output; the shortfall is zero-filled and counted
    // as an underrun. Returns count.
    size_t readWithSilence(double* output, size_t count);
    size_t readWithSilence(std::vector<double>& output) { return readWithSilence(output.data(), output.size()); }

    // Frame-aligned readWithSilence for interleaved data: consumes whole
    // frames only, so a half-written frame stays in the ring. Returns the
    // number of frames taken from the ring; the rest of output is silence.
    size_t readFramesWithSilence(double* output, size_t frames, size_t channels);

    size_t peek(double* output, size_t count) const;
    size_t peek(std::vector<double>& output) const { return peek(output.data(), output.size()); }

    size_t skip(size_t count);
    size_t clear() { return skip(availableRead()); }

    size_t availableRead() const { return m_ring->availableRead(); }
    bool isEmpty() const { return m_ring->isEmpty(); }
    size_t capacity() const { return m_ring->capacity(); }
    double utilization() const { return m_ring->utilization(); }
    bool isUnderrun(double threshold) const { return m_ring->isUnderrun(threshold); }
    uint64_t underrunCount() const { return m_ring->underrunCount(); }
    RingBufferHealth checkHealth() const { return m_ring->checkHealth(); }
    const AudioFormat& format() const { return m_ring->format(); }
    const AudioRingBuffer& ring() const { return *m_ring; }

private:
    explicit RingBufferConsumer(std::shared_ptr<AudioRingBuffer> ring) : m_ring(std::move(ring)) {}
    friend class AudioRingBuffer;

    // Publishes a new read position unless the producer discarded samples
    // underneath us (overwrite mode), in which case its position wins.
    void commitRead(size_t expected, size_t advanced);

    std::shared_ptr<AudioRingBuffer> m_ring;
};
