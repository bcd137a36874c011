#include "AudioEngine.h"
#include "AudioDecoder.h"
#include "DeviceNegotiator.h"
#include "StreamingDecoder.h"
#include "../Settings.h"
#include "../dsp/SampleConverter.h"

#include <QDebug>
#include <QFileInfo>
#include <algorithm>
#include <cstring>

namespace {
// Render scratch, in frames; larger host periods are processed in chunks
constexpr size_t kScratchFrames = 4096;
}

// ── Construction ────────────────────────────────────────────────────
AudioEngine::AudioEngine(QObject* parent)
    : AudioEngine(createPlatformAudioOutput(),
                  []() -> std::unique_ptr<IDecoder> { return std::make_unique<AudioDecoder>(); },
                  parent)
{
}

AudioEngine::AudioEngine(std::unique_ptr<IAudioOutput> output, DecoderFactory decoderFactory,
                         QObject* parent)
    : QObject(parent)
    , m_shared(std::make_shared<EngineShared>())
    , m_output(std::move(output))
    , m_decoderFactory(std::move(decoderFactory))
{
    qRegisterMetaType<PlaybackState>("PlaybackState");

    m_pollTimer = new QTimer(this);
    m_pollTimer->setInterval(50);
    connect(m_pollTimer, &QTimer::timeout, this, &AudioEngine::pollEvents);

    installCallbacks();
}

AudioEngine::~AudioEngine()
{
    if (m_output) {
        m_output->stop();
        m_output->setRenderCallback(nullptr);
        m_output->setErrorCallback(nullptr);
        m_output->close();
    }
    haltStreaming();
}

void AudioEngine::installCallbacks()
{
    if (!m_output) return;

    // The closures own a reference to the shared state and never touch the
    // engine object itself.
    m_output->setRenderCallback([shared = m_shared](uint8_t* buffer, int frames) {
        render(*shared, buffer, frames);
    });
    m_output->setErrorCallback([shared = m_shared](const QString& message) {
        {
            std::lock_guard<std::mutex> lock(shared->deviceErrorMutex);
            shared->deviceErrorMessage = message;
        }
        shared->rtDeviceError.store(true, std::memory_order_release);
    });
}

// ── Errors & events ─────────────────────────────────────────────────
void AudioEngine::fail(AudioError::Kind kind, const QString& message, bool enterError)
{
    AudioError err(kind, message);
    {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError = err;
    }
    qWarning() << "[AudioEngine]" << err.toString();

    if (!enterError) return;

    {
        std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
        m_shared->state = PlaybackState::Error;
    }
    notifyState();
    dispatch(AudioEvent::error(err.toString()));
}

AudioError AudioEngine::lastError() const
{
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_lastError;
}

void AudioEngine::setCallback(AudioEventCallback callback)
{
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_callback = std::move(callback);
}

void AudioEngine::clearCallback()
{
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_callback = nullptr;
}

void AudioEngine::dispatch(const AudioEvent& event)
{
    AudioEventCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        cb = m_callback;
    }
    if (cb) cb(event);

    switch (event.type) {
    case AudioEvent::StateChanged:    emit stateChanged(event.state); break;
    case AudioEvent::PositionChanged: emit positionChanged(event.position); break;
    case AudioEvent::TrackEnded:      emit trackEnded(); break;
    case AudioEvent::Error:           emit errorOccurred(event.message); break;
    case AudioEvent::BufferUnderrun:  emit bufferUnderrun(); break;
    }
}

void AudioEngine::notifyState()
{
    PlaybackState current = state();
    if (current == m_reportedState) return;
    m_reportedState = current;
    qDebug() << "[AudioEngine] State:" << playbackStateName(current);
    dispatch(AudioEvent::stateChanged(current));
}

void AudioEngine::notifyPosition()
{
    uint64_t current = position();
    if (current == m_reportedPosition) return;
    m_reportedPosition = current;
    dispatch(AudioEvent::positionChanged(current));
}

// ── Loading ─────────────────────────────────────────────────────────
bool AudioEngine::loadFile(const QString& filePath)
{
    return load(filePath, false);
}

bool AudioEngine::loadFileWithRingBuffer(const QString& filePath)
{
    return load(filePath, true);
}

bool AudioEngine::validateFile(const QString& filePath)
{
    QFileInfo fi(filePath);
    if (!fi.exists()) {
        fail(AudioError::Io, QStringLiteral("File not found: %1").arg(filePath), true);
        return false;
    }
    if (!fi.isFile() || !fi.isReadable()) {
        fail(AudioError::Io, QStringLiteral("File not readable: %1").arg(filePath), true);
        return false;
    }
    if (!DecoderFormats::isFormatSupported(filePath)) {
        fail(AudioError::Decoding,
             QStringLiteral("Unsupported format: %1").arg(fi.suffix()), true);
        return false;
    }
    if (fi.size() == 0) {
        fail(AudioError::Decoding, QStringLiteral("File is empty: %1").arg(filePath), true);
        return false;
    }
    return true;
}

std::optional<AudioEngine::OpenPlan> AudioEngine::planOutput(const AudioFormat& source)
{
    const auto devices = m_output->enumerateDevices();
    if (devices.empty()) {
        fail(AudioError::AudioDevice, QStringLiteral("No output devices found"), true);
        return std::nullopt;
    }

    auto it = std::find_if(devices.begin(), devices.end(),
                           [this](const AudioDevice& d) { return d.deviceId == m_deviceId; });
    if (it == devices.end()) {
        qWarning() << "[AudioEngine] Device" << m_deviceId << "is gone, using default";
        m_deviceId = 0;
        it = std::find_if(devices.begin(), devices.end(),
                          [](const AudioDevice& d) { return d.isDefault; });
        if (it == devices.end()) it = devices.begin();
    }

    AudioError err;
    if (auto result = DeviceNegotiator::negotiate(it->configRanges, source, &err)) {
        OpenPlan plan;
        plan.outputFormat = result->format;
        return plan;
    }

    if (m_resampleFallback) {
        if (auto rate = DeviceNegotiator::nearestSupportedRate(it->configRanges, source)) {
            AudioFormat target(*rate, source.channels, source.sampleFormat);
            if (auto result = DeviceNegotiator::negotiate(it->configRanges, target)) {
                qDebug() << "[AudioEngine] Resampling" << source.sampleRate << "->" << *rate << "Hz";
                OpenPlan plan;
                plan.outputFormat = result->format;
                plan.resample = true;
                return plan;
            }
        }
    }

    fail(err.kind, err.message, true);
    return std::nullopt;
}

bool AudioEngine::openOutput(const AudioFormat& format)
{
    m_output->close();
    installCallbacks();

    if (m_output->open(format, m_deviceId))
        return true;

    // If a specific device was requested and failed, fall back to default
    if (m_deviceId != 0) {
        qWarning() << "[AudioEngine] Failed to open device" << m_deviceId
                   << "- falling back to default output device";
        m_deviceId = 0;
        if (m_output->open(format, 0))
            return true;
    }

    fail(AudioError::AudioDevice,
         QStringLiteral("Failed to open audio output: %1").arg(m_output->errorString()), true);
    return false;
}

bool AudioEngine::load(const QString& filePath, bool ringBuffer)
{
    qDebug() << "[AudioEngine] Loading" << filePath << (ringBuffer ? "(ring buffer)" : "(static)");

    // Tear down the previous track; the callback sees no source from here on
    if (m_output) m_output->stop();
    m_pollTimer->stop();
    haltStreaming();
    {
        std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
        auto& s = *m_shared;
        s.staticBuffer.reset();
        s.consumer.reset();
        s.streamer.reset();
        s.position = 0;
        s.duration.reset();
        s.format.reset();
        s.producedAudio = false;
        s.rtTrackEnded.store(false, std::memory_order_relaxed);
        s.rtUnderrun.store(false, std::memory_order_relaxed);
    }
    notifyPosition();

    if (!m_output) {
        fail(AudioError::AudioDevice, QStringLiteral("No audio output available"), true);
        return false;
    }

    if (!validateFile(filePath))
        return false;

    std::unique_ptr<IDecoder> decoder = m_decoderFactory ? m_decoderFactory() : nullptr;
    if (!decoder) {
        fail(AudioError::Decoding, QStringLiteral("No decoder available"), true);
        return false;
    }
    if (!decoder->open(filePath)) {
        AudioError err = decoder->lastError();
        fail(err.message.isEmpty() ? AudioError::Decoding : err.kind,
             err.message.isEmpty() ? QStringLiteral("Failed to open: %1").arg(filePath) : err.message,
             true);
        return false;
    }

    const AudioFormat source = decoder->format();
    QString formatError = source.validate();
    if (!formatError.isEmpty()) {
        fail(AudioError::AudioFormat, formatError, true);
        return false;
    }

    auto plan = planOutput(source);
    if (!plan)
        return false;
    const AudioFormat& out = plan->outputFormat;
    const double ratio = (double)out.sampleRate / (double)source.sampleRate;

    std::optional<uint64_t> duration;
    if (auto d = decoder->duration())
        duration = (uint64_t)((double)*d * ratio);

    std::optional<AudioBuffer> staticBuffer;
    std::optional<RingBufferConsumer> consumer;
    std::shared_ptr<StreamingDecoder> streamer;

    if (!ringBuffer) {
        auto decoded = decoder->decodeAll();
        if (!decoded) {
            AudioError err = decoder->lastError();
            fail(AudioError::Decoding,
                 err.message.isEmpty() ? QStringLiteral("Decoding failed") : err.message, true);
            return false;
        }
        if (plan->resample) {
            std::vector<double> converted;
            if (m_resampleQuality == Resampler::Quality::Linear) {
                converted = Resampler::resampleLinear(decoded->samples(), source.channels,
                                                      source.sampleRate, out.sampleRate);
            } else {
                Resampler resampler(source.sampleRate, out.sampleRate, source.channels,
                                    Resampler::Quality::High);
                if (!resampler.isValid()) {
                    fail(AudioError::AudioFormat, resampler.lastError(), true);
                    return false;
                }
                resampler.process(decoded->data(), decoded->frames(), converted);
                resampler.flush(converted);
            }
            decoded = AudioBuffer(std::move(converted),
                                  AudioFormat(out.sampleRate, source.channels, source.sampleFormat));
        }
        duration = decoded->frames();
        staticBuffer = std::move(decoded);
    } else {
        AudioError err;
        AudioFormat ringFormat(out.sampleRate, out.channels, SampleFormat::F64);
        auto config = RingBufferConfig::create(m_ringSeconds, ringFormat, false, &err);
        if (config) config->underrunThreshold = m_shared->underrunThreshold;
        auto handles = config ? AudioRingBuffer::create(*config, &err) : std::nullopt;
        if (!handles) {
            fail(err.kind, err.message, true);
            return false;
        }

        streamer = std::make_shared<StreamingDecoder>(std::move(decoder), std::move(handles->first));
        if (plan->resample && !streamer->enableResampling(out.sampleRate, m_resampleQuality)) {
            fail(AudioError::AudioFormat, streamer->lastError().message, true);
            return false;
        }
        consumer = std::move(handles->second);
    }

    if (!openOutput(out))
        return false;

    {
        std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
        auto& s = *m_shared;
        s.format = source;
        s.outputFormat = out;
        s.rtFrameBytes.store(out.frameSize(), std::memory_order_release);
        s.duration = duration;
        s.position = 0;
        s.processor.setFormat(out);
        s.scratch.assign(kScratchFrames * (size_t)out.channels, 0.0);
        s.staticBuffer = std::move(staticBuffer);
        s.consumer = std::move(consumer);
        s.streamer = streamer;
        s.producedAudio = false;
        s.state = PlaybackState::Stopped;
    }

    // Prefill while stopped
    if (streamer) streamer->start();

    notifyState();
    qDebug() << "[AudioEngine] Loaded" << source.toString() << "->" << out.toString();
    return true;
}

// ── Transport ───────────────────────────────────────────────────────
bool AudioEngine::startOutput()
{
    if (m_output->start())
        return true;

    qWarning() << "[AudioEngine] Stream start failed:" << m_output->errorString()
               << "- attempting recovery";
    std::optional<AudioFormat> out = outputFormat();
    if (out) {
        m_deviceId = 0;
        m_output->close();
        installCallbacks();
        if (m_output->open(*out, 0) && m_output->start())
            return true;
    }

    fail(AudioError::AudioDevice,
         QStringLiteral("Failed to start audio stream: %1").arg(m_output->errorString()), true);
    return false;
}

bool AudioEngine::play()
{
    finishEndedTrack();

    PlaybackState current = state();
    if (current == PlaybackState::Error) {
        fail(AudioError::AudioEngine, QStringLiteral("Cannot play while in error state"), false);
        return false;
    }
    if (current == PlaybackState::Playing || current == PlaybackState::Buffering)
        return true;

    std::shared_ptr<StreamingDecoder> streamer;
    {
        std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
        if (!m_shared->staticBuffer && !m_shared->consumer) {
            lock.unlock();
            fail(AudioError::AudioEngine, QStringLiteral("No track loaded"), false);
            return false;
        }
        streamer = m_shared->streamer;
    }

    if (streamer && !streamer->isRunning() && !streamer->isFinished())
        streamer->start();

    {
        std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
        m_shared->state = PlaybackState::Playing;
    }

    if (!startOutput())
        return false;

    m_pollTimer->start();
    notifyState();
    return true;
}

bool AudioEngine::pause()
{
    PlaybackState current = state();
    if (current == PlaybackState::Error) {
        fail(AudioError::AudioEngine, QStringLiteral("Cannot pause while in error state"), false);
        return false;
    }
    if (current == PlaybackState::Paused)
        return true;
    if (current == PlaybackState::Stopped) {
        fail(AudioError::AudioEngine, QStringLiteral("Cannot pause while stopped"), false);
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
        m_shared->state = PlaybackState::Paused;
    }
    // Stream stays allocated
    m_output->stop();
    m_pollTimer->stop();
    notifyState();
    notifyPosition();
    return true;
}

bool AudioEngine::stop()
{
    finishEndedTrack();

    if (state() == PlaybackState::Error) {
        // Position still goes back to 0; the stream stays down
        uint64_t previous;
        {
            std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
            previous = m_shared->position;
            m_shared->position = 0;
            m_shared->producedAudio = false;
        }
        if (previous != 0) {
            m_reportedPosition = 0;
            dispatch(AudioEvent::positionChanged(0));
        }
        fail(AudioError::AudioEngine, QStringLiteral("Cannot stop while in error state"), false);
        return false;
    }

    if (m_output) m_output->stop();
    m_pollTimer->stop();

    {
        std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
        m_shared->state = PlaybackState::Stopped;
    }
    rewindStreaming();

    notifyState();
    notifyPosition();
    return true;
}

void AudioEngine::haltStreaming()
{
    std::shared_ptr<StreamingDecoder> streamer;
    {
        std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
        streamer = m_shared->streamer;
    }
    if (streamer) streamer->stop();
}

// Position back to 0; the ring path restarts its prefill from the top
void AudioEngine::rewindStreaming()
{
    haltStreaming();

    std::shared_ptr<StreamingDecoder> streamer;
    {
        std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
        auto& s = *m_shared;
        s.position = 0;
        s.producedAudio = false;
        if (s.consumer) s.consumer->clear();
        streamer = s.streamer;
    }

    if (streamer && streamer->seek(0))
        streamer->start();
}

bool AudioEngine::seek(uint64_t frames)
{
    finishEndedTrack();

    if (state() == PlaybackState::Error) {
        fail(AudioError::AudioEngine, QStringLiteral("Cannot seek while in error state"), false);
        return false;
    }

    haltStreaming();

    std::shared_ptr<StreamingDecoder> streamer;
    uint64_t sourceFrame = 0;
    uint64_t previous = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
        auto& s = *m_shared;
        if (s.duration)
            frames = std::min(frames, *s.duration);
        previous = s.position;
        s.position = frames;
        if (s.consumer) {
            s.consumer->clear();
            s.producedAudio = false;
        }
        streamer = s.streamer;
        if (streamer && s.format && s.outputFormat.sampleRate > 0)
            sourceFrame = (uint64_t)((double)frames * s.format->sampleRate / s.outputFormat.sampleRate);
    }

    if (streamer) {
        if (!streamer->seek(sourceFrame)) {
            fail(AudioError::Decoding, streamer->lastError().message, false);
            streamer->start();
            return false;
        }
        streamer->start();
    }

    // Compared against the position before the seek, not the last report
    if (frames != previous) {
        m_reportedPosition = frames;
        dispatch(AudioEvent::positionChanged(frames));
    }
    return true;
}

// ── Volume ──────────────────────────────────────────────────────────
void AudioEngine::setVolume(double volume)
{
    std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
    m_shared->processor.setVolume(volume);
    m_shared->muted = false;
}

void AudioEngine::setVolumeRamped(double volume, int durationMs)
{
    std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
    m_shared->processor.setVolumeRamped(volume, durationMs);
    m_shared->muted = false;
}

double AudioEngine::volume() const
{
    std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
    return m_shared->processor.targetVolume();
}

void AudioEngine::mute()
{
    std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
    auto& s = *m_shared;
    if (s.muted) return;
    s.preMuteVolume = s.processor.targetVolume();
    s.processor.setVolumeRamped(0.0, m_rampMs);
    s.muted = true;
}

void AudioEngine::unmute()
{
    std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
    auto& s = *m_shared;
    if (!s.muted) return;
    s.processor.setVolumeRamped(s.preMuteVolume, m_rampMs);
    s.muted = false;
}

bool AudioEngine::isMuted() const
{
    std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
    return m_shared->muted;
}

// ── Accessors ───────────────────────────────────────────────────────
PlaybackState AudioEngine::state() const
{
    std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
    return m_shared->state;
}

uint64_t AudioEngine::position() const
{
    std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
    return m_shared->position;
}

std::optional<uint64_t> AudioEngine::duration() const
{
    std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
    return m_shared->duration;
}

std::optional<AudioFormat> AudioEngine::format() const
{
    std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
    return m_shared->format;
}

std::optional<AudioFormat> AudioEngine::outputFormat() const
{
    std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
    if (!m_shared->format) return std::nullopt;
    return m_shared->outputFormat;
}

uint64_t AudioEngine::underrunCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
    return m_shared->consumer ? m_shared->consumer->underrunCount() : 0;
}

bool AudioEngine::isRingBufferMode() const
{
    std::shared_lock<std::shared_mutex> lock(m_shared->mutex);
    return m_shared->consumer.has_value();
}

// ── Devices ─────────────────────────────────────────────────────────
std::vector<AudioDevice> AudioEngine::availableDevices() const
{
    return m_output ? m_output->enumerateDevices() : std::vector<AudioDevice>();
}

void AudioEngine::setOutputDevice(uint32_t deviceId)
{
    m_deviceId = deviceId;
}

bool AudioEngine::recoverFromError()
{
    if (!m_output) return false;
    qDebug() << "[AudioEngine] Recovering on the default device";

    m_output->stop();
    m_pollTimer->stop();
    m_deviceId = 0;

    if (m_output->enumerateDevices().empty()) {
        fail(AudioError::AudioDevice, QStringLiteral("No output devices found"), false);
        return false;
    }

    // With no stream open (nothing loaded, or the load failed before the
    // device was opened) there is nothing to reopen; only Error is cleared.
    std::optional<AudioFormat> out = outputFormat();
    if (out) {
        m_output->close();
        installCallbacks();
        if (!m_output->open(*out, 0)) {
            fail(AudioError::AudioDevice,
                 QStringLiteral("Recovery failed: %1").arg(m_output->errorString()), false);
            return false;
        }
    }

    m_shared->rtTrackEnded.store(false, std::memory_order_release);
    {
        std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
        m_shared->state = PlaybackState::Stopped;
    }
    rewindStreaming();
    notifyState();
    notifyPosition();
    return true;
}

// ── Configuration ───────────────────────────────────────────────────
void AudioEngine::setDitherAlgorithm(DitherAlgorithm algorithm)
{
    std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
    m_shared->ditherer.setAlgorithm(algorithm);
    m_shared->ditherEnabled = algorithm != DitherAlgorithm::None;
}

void AudioEngine::setResampleFallback(bool enabled, Resampler::Quality quality)
{
    m_resampleFallback = enabled;
    m_resampleQuality = quality;
}

void AudioEngine::setUnderrunThreshold(double fraction)
{
    std::unique_lock<std::shared_mutex> lock(m_shared->mutex);
    m_shared->underrunThreshold = std::clamp(fraction, 0.0, 1.0);
}

void AudioEngine::applySettings(const Settings& settings)
{
    setVolume(settings.volume() / 100.0);
    setRampDurationMs(settings.rampDurationMs());
    setRingBufferSeconds(settings.ringBufferSeconds());
    setOutputDevice(settings.outputDeviceId());
    setDitherAlgorithm(Ditherer::algorithmFromString(settings.dither()));
    setResampleFallback(settings.resampleFallback(),
                        Resampler::qualityFromString(settings.resampleQuality()));
    setUnderrunThreshold(settings.underrunThreshold());
}

// ── render (called from audio thread) ───────────────────────────────
void AudioEngine::render(EngineShared& s, uint8_t* buffer, int frames)
{
    const size_t frameBytes = s.rtFrameBytes.load(std::memory_order_acquire);

    // try_lock: never block the real-time thread
    std::unique_lock<std::shared_mutex> lock(s.mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        // Control thread holds the lock (load/seek/stop): silence this cycle
        std::memset(buffer, 0, (size_t)frames * frameBytes);
        return;
    }

    const bool active = s.state == PlaybackState::Playing || s.state == PlaybackState::Buffering;
    const bool hasSource = s.staticBuffer || s.consumer;
    if (!active || !hasSource || s.scratch.empty() || frames <= 0) {
        std::memset(buffer, 0, (size_t)frames * frameBytes);
        return;
    }

    const size_t ch = (size_t)s.outputFormat.channels;
    const size_t chunkFrames = s.scratch.size() / ch;
    const int sourceBits = s.format ? SampleFormats::bitsPerSample(s.format->sampleFormat) : 64;
    const SampleFormat outFmt = s.outputFormat.sampleFormat;
    const bool dither = s.ditherEnabled && SampleFormats::isInteger(outFmt)
                        && SampleFormats::bitsPerSample(outFmt) < sourceBits;

    size_t done = 0;
    while (done < (size_t)frames) {
        const size_t n = std::min(chunkFrames, (size_t)frames - done);
        const size_t samples = n * ch;
        double* scratch = s.scratch.data();
        uint8_t* dst = buffer + done * frameBytes;

        bool endOfData = false;

        if (s.state != PlaybackState::Playing && s.state != PlaybackState::Buffering) {
            // Track ended earlier in this callback
            std::memset(dst, 0, n * frameBytes);
            done += n;
            continue;
        }

        if (s.staticBuffer) {
            const AudioBuffer& buf = *s.staticBuffer;
            const size_t total = buf.frames();
            const size_t pos = (size_t)std::min<uint64_t>(s.position, total);
            const size_t avail = std::min(n, total - pos);
            if (avail > 0)
                std::copy_n(buf.data() + pos * ch, avail * ch, scratch);
            std::fill(scratch + avail * ch, scratch + samples, 0.0);
            s.position += avail;
            endOfData = avail < n;
        } else {
            RingBufferConsumer& consumer = *s.consumer;
            const bool exhausted = s.streamer && s.streamer->isFinished();

            if (!s.producedAudio) {
                if (!exhausted && consumer.isUnderrun(s.underrunThreshold)) {
                    s.state = PlaybackState::Buffering;
                    std::memset(dst, 0, n * frameBytes);
                    done += n;
                    continue;
                }
                s.producedAudio = true;
                s.state = PlaybackState::Playing;
            }

            size_t got;
            if (exhausted) {
                got = consumer.read(scratch, std::min(consumer.availableRead(), samples) / ch * ch) / ch;
                std::fill(scratch + got * ch, scratch + samples, 0.0);
                endOfData = got < n;
            } else {
                // Whole frames only so channels never shift
                got = consumer.readFramesWithSilence(scratch, n, ch);
                if (got < n)
                    s.rtUnderrun.store(true, std::memory_order_release);
            }
            s.position += got;
        }

        s.processor.applyVolume(scratch, samples);
        if (dither)
            s.ditherer.applyForFormat(scratch, samples, outFmt);
        SampleConverter::fromCanonical(scratch, dst, samples, outFmt);
        done += n;

        if (endOfData) {
            s.state = PlaybackState::Stopped;
            s.rtTrackEnded.store(true, std::memory_order_release);
        }
    }
}

// ── pollEvents (main thread) ────────────────────────────────────────
bool AudioEngine::finishEndedTrack()
{
    if (!m_shared->rtTrackEnded.exchange(false, std::memory_order_acquire))
        return false;

    m_output->stop();
    m_pollTimer->stop();
    rewindStreaming();
    notifyState();
    notifyPosition();
    dispatch(AudioEvent::trackEnded());
    return true;
}

void AudioEngine::pollEvents()
{
    auto& s = *m_shared;

    if (s.rtDeviceError.exchange(false, std::memory_order_acquire)) {
        QString message;
        {
            std::lock_guard<std::mutex> lock(s.deviceErrorMutex);
            message = s.deviceErrorMessage;
        }
        m_output->stop();
        m_pollTimer->stop();
        fail(AudioError::AudioDevice, message, true);

        // One automatic attempt; on failure we stay in Error until a new load
        if (!m_recovering) {
            m_recovering = true;
            recoverFromError();
            m_recovering = false;
        }
        return;
    }

    if (finishEndedTrack())
        return;

    if (s.rtUnderrun.exchange(false, std::memory_order_acquire))
        dispatch(AudioEvent::bufferUnderrun());

    notifyState();
    notifyPosition();
}
