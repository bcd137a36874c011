#include "StreamingDecoder.h"

#include <QDebug>
#include <QThread>
#include <algorithm>

StreamingDecoder::StreamingDecoder(std::unique_ptr<IDecoder> decoder,
                                   RingBufferProducer producer,
                                   const StreamConfig& config)
    : m_decoder(std::move(decoder))
    , m_producer(std::move(producer))
    , m_config(config)
{
    m_loop.store(config.loopPlayback, std::memory_order_relaxed);
    if (m_decoder)
        m_sourceFormat = m_decoder->format();
}

StreamingDecoder::~StreamingDecoder()
{
    stop();
}

bool StreamingDecoder::enableResampling(uint32_t targetRate, Resampler::Quality quality)
{
    if (isRunning()) return false;
    if (targetRate == m_sourceFormat.sampleRate) {
        m_resampler.reset();
        return true;
    }

    auto resampler = std::make_unique<Resampler>(m_sourceFormat.sampleRate, targetRate,
                                                 m_sourceFormat.channels, quality);
    if (!resampler->isValid()) {
        setError(AudioError(AudioError::AudioFormat, resampler->lastError()));
        return false;
    }
    m_resampler = std::move(resampler);
    return true;
}

// ── decode loop ─────────────────────────────────────────────────────
void StreamingDecoder::setError(const AudioError& error)
{
    {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_error = error;
    }
    m_hasError.store(true, std::memory_order_release);
    qWarning() << "[Streaming]" << error.toString();
}

AudioError StreamingDecoder::lastError() const
{
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_error;
}

bool StreamingDecoder::refill()
{
    m_pending.clear();
    m_pendingOffset = 0;

    for (;;) {
        auto packet = m_decoder->decodeNext();
        if (packet) {
            m_decodedSinceRewind = true;
            m_framesDecoded.fetch_add(packet->frames, std::memory_order_relaxed);
            if (m_resampler) {
                m_resampler->process(packet->samples.data(), packet->frames, m_pending);
                if (m_pending.empty()) continue;   // filter still priming
            } else {
                m_pending = std::move(packet->samples);
            }
            return true;
        }

        AudioError err = m_decoder->lastError();
        if (!err.message.isEmpty()) {
            setError(err);
            return false;
        }

        // End of stream
        if (m_loop.load(std::memory_order_relaxed) && m_decodedSinceRewind) {
            m_decodedSinceRewind = false;
            if (!m_decoder->seek(0)) {
                setError(m_decoder->lastError());
                return false;
            }
            if (m_resampler) m_resampler->reset();
            qDebug() << "[Streaming] Looping to start";
            continue;
        }

        if (m_resampler && m_resampler->flush(m_pending) > 0)
            return true;
        return false;
    }
}

bool StreamingDecoder::pump()
{
    if (m_pendingOffset >= m_pending.size() && !refill())
        return false;

    const double* src = m_pending.data() + m_pendingOffset;
    const size_t remaining = m_pending.size() - m_pendingOffset;
    size_t written;
    if (m_producer.ring().allowOverwrite()) {
        written = m_producer.writeOverwrite(src, remaining);
    } else {
        // Whole frames only; the ring holds capacity - 1 samples
        const size_t ch = (size_t)std::max(1, m_sourceFormat.channels);
        written = m_producer.write(src, std::min(remaining, m_producer.availableWrite() / ch * ch));
    }
    m_pendingOffset += written;
    return true;
}

void StreamingDecoder::start()
{
    if (isRunning() || !m_decoder) return;
    if (m_worker) stop();   // reap a worker that ran to completion

    m_stopRequested.store(false, std::memory_order_release);
    m_finished.store(false, std::memory_order_release);

    // Prefetch on the caller's thread so playback starts with data
    for (int i = 0; i < m_config.prefetchPackets; ++i) {
        if (m_producer.isFull()) break;
        if (!pump()) {
            m_finished.store(true, std::memory_order_release);
            return;
        }
    }

    m_running.store(true, std::memory_order_release);
    m_worker = QThread::create([this]() {
        while (!m_stopRequested.load(std::memory_order_acquire)) {
            const size_t before = m_pendingOffset;
            const bool wasEmpty = m_pendingOffset >= m_pending.size();
            if (!pump()) {
                m_finished.store(true, std::memory_order_release);
                break;
            }
            // Ring full: nothing moved, back off
            if (!wasEmpty && m_pendingOffset == before)
                QThread::msleep((unsigned long)m_config.idleSleepMs);
        }
        m_running.store(false, std::memory_order_release);
    });
    m_worker->start();
}

void StreamingDecoder::stop()
{
    m_stopRequested.store(true, std::memory_order_release);
    if (m_worker) {
        m_worker->wait();
        delete m_worker;
        m_worker = nullptr;
    }
    m_running.store(false, std::memory_order_release);
}

bool StreamingDecoder::seek(uint64_t frame)
{
    if (isRunning() || !m_decoder) return false;

    if (!m_decoder->seek(frame)) {
        setError(m_decoder->lastError());
        return false;
    }
    m_pending.clear();
    m_pendingOffset = 0;
    m_decodedSinceRewind = false;
    if (m_resampler) m_resampler->reset();
    m_finished.store(false, std::memory_order_release);
    return true;
}
