#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <QString>
#include "AudioDevice.h"
#include "../core/audio/AudioFormat.h"

class IAudioOutput {
public:
    virtual ~IAudioOutput() = default;

    IAudioOutput(const IAudioOutput&) = delete;
    IAudioOutput& operator=(const IAudioOutput&) = delete;

    // Pull callback, invoked on the host's real-time thread. `buffer` holds
    // frames * streamFormat().frameSize() bytes in the opened format and must
    // be filled completely.
    using RenderCallback = std::function<void(uint8_t* buffer, int frames)>;

    // Asynchronous stream failure, also from the real-time thread
    using ErrorCallback = std::function<void(const QString& message)>;

    // Lifecycle. deviceId 0 opens the system default.
    virtual bool open(const AudioFormat& format, uint32_t deviceId = 0) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual bool isRunning() const = 0;

    // Callbacks; set before start()
    virtual void setRenderCallback(RenderCallback cb) = 0;
    virtual void setErrorCallback(ErrorCallback cb) = 0;

    // Period size hint in frames, applied on the next open()
    virtual void setBufferSize(uint32_t frames) = 0;

    // Signal path info
    virtual AudioFormat streamFormat() const = 0;
    virtual std::string deviceName() const = 0;

    // Last failure of open/start, for error reporting
    virtual QString errorString() const = 0;

    // Device queries
    virtual std::vector<AudioDevice> enumerateDevices() const = 0;

protected:
    IAudioOutput() = default;
};

// Implemented per platform
std::unique_ptr<IAudioOutput> createPlatformAudioOutput();
