#pragma once

#include "../IAudioOutput.h"

// ALSA playback stream driven by its own render thread. The thread pulls one
// period at a time from the render callback and writes it with
// snd_pcm_writei(); xruns are recovered in place.
class AlsaOutput : public IAudioOutput {
public:
    AlsaOutput();
    ~AlsaOutput() override;

    // Lifecycle
    bool open(const AudioFormat& format, uint32_t deviceId = 0) override;
    bool start() override;
    void stop() override;
    void close() override;
    bool isOpen() const override;
    bool isRunning() const override;

    void setRenderCallback(RenderCallback cb) override;
    void setErrorCallback(ErrorCallback cb) override;
    void setBufferSize(uint32_t frames) override;

    AudioFormat streamFormat() const override;
    std::string deviceName() const override;
    QString errorString() const override;

    std::vector<AudioDevice> enumerateDevices() const override;

    static std::vector<AudioDevice> enumerateDevicesStatic();

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};
