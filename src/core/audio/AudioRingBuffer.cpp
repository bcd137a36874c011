#include "AudioRingBuffer.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

// ── RingBufferConfig ────────────────────────────────────────────────
std::optional<RingBufferConfig> RingBufferConfig::create(double durationSeconds,
                                                         const AudioFormat& format,
                                                         bool allowOverwrite,
                                                         AudioError* error)
{
    RingBufferConfig config;
    config.bufferDurationSeconds = durationSeconds;
    config.format = format;
    config.allowOverwrite = allowOverwrite;

    if (auto err = config.validate()) {
        if (error) *error = *err;
        return std::nullopt;
    }
    return config;
}

RingBufferConfig RingBufferConfig::lowLatency(const AudioFormat& format)
{
    RingBufferConfig config;
    config.bufferDurationSeconds = 0.5;
    config.format = format;
    return config;
}

RingBufferConfig RingBufferConfig::standard(const AudioFormat& format)
{
    RingBufferConfig config;
    config.bufferDurationSeconds = 2.5;
    config.format = format;
    return config;
}

RingBufferConfig RingBufferConfig::highLatency(const AudioFormat& format)
{
    RingBufferConfig config;
    config.bufferDurationSeconds = 4.5;
    config.format = format;
    return config;
}

size_t RingBufferConfig::totalSamples() const
{
    if (bufferDurationSeconds <= 0.0 || format.channels <= 0)
        return 0;
    auto frames = static_cast<size_t>(std::floor(bufferDurationSeconds * format.sampleRate));
    return frames * static_cast<size_t>(format.channels);
}

std::optional<AudioError> RingBufferConfig::validate() const
{
    if (!(bufferDurationSeconds >= kMinDurationSeconds))
        return AudioError(AudioError::AudioFormat,
                          QStringLiteral("Buffer duration must be at least %1 seconds")
                              .arg(kMinDurationSeconds));
    if (bufferDurationSeconds > kMaxDurationSeconds)
        return AudioError(AudioError::AudioFormat,
                          QStringLiteral("Buffer duration must not exceed %1 seconds")
                              .arg(kMaxDurationSeconds));

    QString formatError = format.validate();
    if (!formatError.isEmpty())
        return AudioError(AudioError::AudioFormat, formatError);

    if (underrunThreshold < 0.0 || underrunThreshold > 1.0)
        return AudioError(AudioError::AudioFormat,
                          QStringLiteral("Underrun threshold %1 is outside [0, 1]")
                              .arg(underrunThreshold));

    if (bufferSizeBytes() > kMaxBytes)
        return AudioError(AudioError::AudioFormat,
                          QStringLiteral("Buffer size (%1 MB) exceeds maximum allowed (100 MB)")
                              .arg(bufferSizeBytes() / (1024 * 1024)));

    // Need at least one usable slot besides the gap
    if (totalSamples() < 2)
        return AudioError(AudioError::AudioFormat,
                          QStringLiteral("Buffer holds fewer than two samples"));
    return std::nullopt;
}

// ── AudioRingBuffer ─────────────────────────────────────────────────
AudioRingBuffer::AudioRingBuffer(const RingBufferConfig& config)
    : m_buffer(config.totalSamples(), 0.0)
    , m_capacity(config.totalSamples())
    , m_format(config.format)
    , m_allowOverwrite(config.allowOverwrite)
    , m_underrunThreshold(config.underrunThreshold)
{
}

std::optional<AudioRingBuffer::Handles> AudioRingBuffer::create(const RingBufferConfig& config,
                                                                AudioError* error)
{
    if (auto err = config.validate()) {
        qWarning() << "[RingBuffer] Rejected config:" << err->message;
        if (error) *error = *err;
        return std::nullopt;
    }

    std::shared_ptr<AudioRingBuffer> ring(new AudioRingBuffer(config));
    qDebug() << "[RingBuffer] Created" << ring->capacity() << "samples ("
             << config.bufferDurationSeconds << "s," << config.format.toString() << ")";

    return Handles(RingBufferProducer(ring), RingBufferConsumer(ring));
}

size_t AudioRingBuffer::availableRead() const
{
    size_t w = m_writePos.load(std::memory_order_acquire);
    size_t r = m_readPos.load(std::memory_order_acquire);
    return distance(r, w);
}

bool AudioRingBuffer::isUnderrun(double threshold) const
{
    return (double)availableRead() < threshold * (double)m_capacity;
}

RingBufferHealth AudioRingBuffer::checkHealth() const
{
    RingBufferHealth health;
    health.availableRead = availableRead();
    health.utilization = (double)health.availableRead / (double)m_capacity;
    health.underrunCount = underrunCount();
    health.underrun = (double)health.availableRead < m_underrunThreshold * (double)m_capacity;
    return health;
}

void AudioRingBuffer::copyIn(size_t pos, const double* src, size_t count)
{
    const size_t head = std::min(count, m_capacity - pos);
    std::copy(src, src + head, m_buffer.begin() + pos);
    std::copy(src + head, src + count, m_buffer.begin());
}

void AudioRingBuffer::copyOut(size_t pos, double* dst, size_t count) const
{
    const size_t head = std::min(count, m_capacity - pos);
    auto first = m_buffer.cbegin() + pos;
    std::copy(first, first + head, dst);
    std::copy(m_buffer.cbegin(), m_buffer.cbegin() + (count - head), dst + head);
}

// ── RingBufferProducer ──────────────────────────────────────────────
size_t RingBufferProducer::write(const double* samples, size_t count)
{
    AudioRingBuffer& ring = *m_ring;
    const size_t toWrite = std::min(count, ring.availableWrite());
    if (toWrite == 0) return 0;

    const size_t w = ring.m_writePos.load(std::memory_order_acquire);
    ring.copyIn(w, samples, toWrite);
    ring.m_writePos.store((w + toWrite) % ring.m_capacity, std::memory_order_release);
    return toWrite;
}

size_t RingBufferProducer::writeOverwrite(const double* samples, size_t count)
{
    AudioRingBuffer& ring = *m_ring;
    const size_t capacity = ring.m_capacity;
    const size_t toWrite = std::min(count, capacity - 1);
    if (toWrite == 0) return 0;

    const size_t w = ring.m_writePos.load(std::memory_order_acquire);

    // Drop the oldest samples first so the reader never sees the region
    // being overwritten as readable.
    size_t r = ring.m_readPos.load(std::memory_order_acquire);
    for (;;) {
        const size_t freeSlots = capacity - 1 - ring.distance(r, w);
        if (toWrite <= freeSlots) break;
        const size_t drop = toWrite - freeSlots;
        if (ring.m_readPos.compare_exchange_weak(r, (r + drop) % capacity,
                                                 std::memory_order_acq_rel,
                                                 std::memory_order_acquire))
            break;
    }

    ring.copyIn(w, samples, toWrite);
    ring.m_writePos.store((w + toWrite) % capacity, std::memory_order_release);
    return toWrite;
}

// ── RingBufferConsumer ──────────────────────────────────────────────
void RingBufferConsumer::commitRead(size_t expected, size_t advanced)
{
    AudioRingBuffer& ring = *m_ring;
    size_t r = expected;
    ring.m_readPos.compare_exchange_strong(r, (expected + advanced) % ring.m_capacity,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire);
}

size_t RingBufferConsumer::read(double* output, size_t count)
{
    AudioRingBuffer& ring = *m_ring;
    const size_t toRead = std::min(count, ring.availableRead());
    if (toRead == 0) return 0;

    const size_t r = ring.m_readPos.load(std::memory_order_acquire);
    ring.copyOut(r, output, toRead);
    commitRead(r, toRead);
    return toRead;
}

size_t RingBufferConsumer::readWithSilence(double* output, size_t count)
{
    const size_t got = read(output, count);
    if (got < count) {
        std::fill(output + got, output + count, 0.0);
        m_ring->m_underrunCount.fetch_add(1, std::memory_order_relaxed);
    }
    return count;
}

size_t RingBufferConsumer::readFramesWithSilence(double* output, size_t frames, size_t channels)
{
    if (channels == 0) return 0;
    const size_t samples = frames * channels;
    const size_t whole = std::min(samples, m_ring->availableRead()) / channels * channels;
    const size_t got = read(output, whole);
    if (got < samples) {
        std::fill(output + got, output + samples, 0.0);
        m_ring->m_underrunCount.fetch_add(1, std::memory_order_relaxed);
    }
    return got / channels;
}

size_t RingBufferConsumer::peek(double* output, size_t count) const
{
    const AudioRingBuffer& ring = *m_ring;
    const size_t toPeek = std::min(count, ring.availableRead());
    if (toPeek == 0) return 0;

    ring.copyOut(ring.m_readPos.load(std::memory_order_acquire), output, toPeek);
    return toPeek;
}

size_t RingBufferConsumer::skip(size_t count)
{
    AudioRingBuffer& ring = *m_ring;
    const size_t toSkip = std::min(count, ring.availableRead());
    if (toSkip == 0) return 0;

    commitRead(ring.m_readPos.load(std::memory_order_acquire), toSkip);
    return toSkip;
}
