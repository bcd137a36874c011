#pragma once

#include <QObject>
#include <QTimer>
#include <QString>
#include <memory>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>
#include <cstdint>

#include "AudioBuffer.h"
#include "AudioError.h"
#include "AudioEvent.h"
#include "AudioFormat.h"
#include "AudioRingBuffer.h"
#include "IDecoder.h"
#include "../dsp/AudioProcessor.h"
#include "../dsp/Ditherer.h"
#include "../dsp/Resampler.h"
#include "../../platform/IAudioOutput.h"

class Settings;
class StreamingDecoder;

// Everything the render callback touches. Owned jointly by the engine and
// the callback closure; guarded by `mutex` (the callback only try-locks).
struct EngineShared {
    mutable std::shared_mutex mutex;

    PlaybackState  state = PlaybackState::Stopped;
    AudioProcessor processor;
    bool           muted = false;
    double         preMuteVolume = 1.0;

    uint64_t                   position = 0;       // frames at the output rate
    std::optional<uint64_t>    duration;
    std::optional<AudioFormat> format;             // source
    AudioFormat                outputFormat;

    // Exactly one source is active at a time
    std::optional<AudioBuffer>        staticBuffer;
    std::optional<RingBufferConsumer> consumer;
    std::shared_ptr<StreamingDecoder> streamer;
    double                            underrunThreshold = 0.1;
    bool                              producedAudio = false;

    Ditherer            ditherer;
    bool                ditherEnabled = true;
    std::vector<double> scratch;                   // sized on load

    // Output frame size, readable without the lock
    std::atomic<size_t> rtFrameBytes{AudioFormat().frameSize()};

    // Set on the real-time thread, consumed by AudioEngine::pollEvents()
    std::atomic<bool> rtTrackEnded{false};
    std::atomic<bool> rtUnderrun{false};
    std::atomic<bool> rtDeviceError{false};
    std::mutex        deviceErrorMutex;
    QString           deviceErrorMessage;
};

class AudioEngine : public QObject {
    Q_OBJECT

public:
    using DecoderFactory = std::function<std::unique_ptr<IDecoder>()>;

    // Platform output, FFmpeg decoder
    explicit AudioEngine(QObject* parent = nullptr);
    AudioEngine(std::unique_ptr<IAudioOutput> output, DecoderFactory decoderFactory,
                QObject* parent = nullptr);
    ~AudioEngine() override;

    // ── Loading ──────────────────────────────────────────────────────
    // Decode the whole file up front and play from memory
    bool loadFile(const QString& filePath);
    // Stream through a ring buffer fed by a decode thread
    bool loadFileWithRingBuffer(const QString& filePath);

    // ── Transport ────────────────────────────────────────────────────
    bool play();
    bool pause();
    bool stop();
    bool seek(uint64_t frames);

    // ── Volume ───────────────────────────────────────────────────────
    void setVolume(double volume);                       // 0.0 - 1.0, clears mute
    void setVolumeRamped(double volume, int durationMs); // clears mute
    double volume() const;
    void mute();
    void unmute();
    bool isMuted() const;

    // ── Observation ──────────────────────────────────────────────────
    void setCallback(AudioEventCallback callback);
    void clearCallback();

    PlaybackState state() const;
    uint64_t position() const;
    std::optional<uint64_t> duration() const;
    std::optional<AudioFormat> format() const;
    std::optional<AudioFormat> outputFormat() const;
    uint64_t underrunCount() const;
    bool isRingBufferMode() const;

    AudioError lastError() const;

    // ── Devices ──────────────────────────────────────────────────────
    std::vector<AudioDevice> availableDevices() const;
    void setOutputDevice(uint32_t deviceId);
    uint32_t outputDevice() const { return m_deviceId; }

    // Reopen the default device; Error -> Stopped on success
    bool recoverFromError();

    // ── Configuration ────────────────────────────────────────────────
    void applySettings(const Settings& settings);
    void setRampDurationMs(int ms) { m_rampMs = ms < 0 ? 0 : ms; }
    void setRingBufferSeconds(double seconds) { m_ringSeconds = seconds; }
    void setDitherAlgorithm(DitherAlgorithm algorithm);
    void setResampleFallback(bool enabled, Resampler::Quality quality);
    void setUnderrunThreshold(double fraction);

public slots:
    // Dispatches events raised on the real-time thread. Driven by a timer
    // while a stream is running; may also be called directly.
    void pollEvents();

signals:
    void stateChanged(PlaybackState state);
    void positionChanged(qulonglong frames);
    void trackEnded();
    void errorOccurred(const QString& message);
    void bufferUnderrun();

private:
    struct OpenPlan {
        AudioFormat outputFormat;
        bool        resample = false;
    };

    bool load(const QString& filePath, bool ringBuffer);
    bool validateFile(const QString& filePath);
    std::optional<OpenPlan> planOutput(const AudioFormat& source);
    bool openOutput(const AudioFormat& format);
    bool startOutput();
    void installCallbacks();
    void haltStreaming();
    void rewindStreaming();
    // Delivers an end of track the render thread recorded but pollEvents()
    // has not dispatched yet. Returns true if there was one.
    bool finishEndedTrack();

    static void render(EngineShared& s, uint8_t* buffer, int frames);

    // Records the error; with `enterError` also moves to Error and emits it
    void fail(AudioError::Kind kind, const QString& message, bool enterError);
    void dispatch(const AudioEvent& event);
    void notifyState();
    void notifyPosition();

    std::shared_ptr<EngineShared>  m_shared;
    std::unique_ptr<IAudioOutput>  m_output;
    DecoderFactory                 m_decoderFactory;

    uint32_t m_deviceId = 0;
    int      m_rampMs = 20;
    double   m_ringSeconds = 2.5;
    bool     m_resampleFallback = true;
    Resampler::Quality m_resampleQuality = Resampler::Quality::High;

    mutable std::mutex m_callbackMutex;
    AudioEventCallback m_callback;

    mutable std::mutex m_errorMutex;
    AudioError         m_lastError;

    PlaybackState m_reportedState = PlaybackState::Stopped;
    uint64_t      m_reportedPosition = 0;
    bool          m_recovering = false;

    QTimer* m_pollTimer = nullptr;
};
