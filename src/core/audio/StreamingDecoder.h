#pragma once

#include <QString>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

#include "AudioError.h"
#include "AudioRingBuffer.h"
#include "IDecoder.h"
#include "../dsp/Resampler.h"

class QThread;

struct StreamConfig {
    bool loopPlayback = false;
    int  prefetchPackets = 4;     // decoded synchronously by start()
    int  idleSleepMs = 5;         // back-off while the ring is full
};

// Decode thread feeding a ring buffer producer. Owns the decoder and the
// producer handle; the consumer stays with the render side.
//
// Lifecycle: start() -> [stop() -> seek() -> start()]* -> destruction.
// seek() is only valid while stopped so the decoder is never touched from
// two threads.
class StreamingDecoder {
public:
    StreamingDecoder(std::unique_ptr<IDecoder> decoder,
                     RingBufferProducer producer,
                     const StreamConfig& config = StreamConfig());
    ~StreamingDecoder();

    StreamingDecoder(const StreamingDecoder&) = delete;
    StreamingDecoder& operator=(const StreamingDecoder&) = delete;

    // Convert from the decoder's rate to `targetRate` before writing.
    // Call before start().
    bool enableResampling(uint32_t targetRate, Resampler::Quality quality);
    bool isResampling() const { return m_resampler != nullptr; }

    void start();
    void stop();
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    bool seek(uint64_t frame);

    // Everything decoded has been handed to the ring
    bool isFinished() const { return m_finished.load(std::memory_order_acquire); }

    bool hasError() const { return m_hasError.load(std::memory_order_acquire); }
    AudioError lastError() const;

    AudioFormat sourceFormat() const { return m_sourceFormat; }
    uint64_t framesDecoded() const { return m_framesDecoded.load(std::memory_order_relaxed); }
    const StreamConfig& config() const { return m_config; }
    void setLoopPlayback(bool loop) { m_loop.store(loop, std::memory_order_relaxed); }

private:
    // One step: refill m_pending if empty, then push it into the ring.
    // Returns false once the stream is exhausted.
    bool pump();
    bool refill();
    void setError(const AudioError& error);

    std::unique_ptr<IDecoder>  m_decoder;
    RingBufferProducer         m_producer;
    std::unique_ptr<Resampler> m_resampler;
    StreamConfig               m_config;
    AudioFormat                m_sourceFormat;

    std::vector<double> m_pending;
    size_t              m_pendingOffset = 0;
    bool                m_decodedSinceRewind = false;

    QThread*          m_worker = nullptr;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_finished{false};
    std::atomic<bool> m_hasError{false};
    std::atomic<bool> m_loop{false};
    std::atomic<uint64_t> m_framesDecoded{0};

    mutable std::mutex m_errorMutex;
    AudioError         m_error;
};
