#pragma once

// Test doubles for the hardware and decoder seams of the engine.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <thread>
#include <vector>

#include "core/audio/IDecoder.h"
#include "platform/IAudioOutput.h"

// ── FakeAudioOutput ─────────────────────────────────────────────────
// Never spawns a thread; tests pull audio by calling render() themselves.
class FakeAudioOutput : public IAudioOutput {
public:
    FakeAudioOutput()
    {
        AudioDevice dev;
        dev.deviceId = 0;
        dev.name = "Fake Output";
        dev.systemName = "fake";
        dev.isDefault = true;
        dev.configRanges.push_back({8000, 192000, 2, SampleFormat::F32});
        dev.configRanges.push_back({8000, 192000, 1, SampleFormat::F32});
        devices.push_back(dev);
    }

    bool open(const AudioFormat& format, uint32_t deviceId) override
    {
        ++openCount;
        lastDeviceId = deviceId;
        if (failOpen) {
            m_error = QStringLiteral("fake open failure");
            return false;
        }
        m_format = format;
        m_open = true;
        return true;
    }

    bool start() override
    {
        if (!m_open || failStart) {
            m_error = QStringLiteral("fake start failure");
            return false;
        }
        m_running = true;
        return true;
    }

    void stop() override { m_running = false; }
    void close() override { m_running = false; m_open = false; }
    bool isOpen() const override { return m_open; }
    bool isRunning() const override { return m_running; }

    void setRenderCallback(RenderCallback cb) override { m_render = std::move(cb); }
    void setErrorCallback(ErrorCallback cb) override { m_onError = std::move(cb); }
    void setBufferSize(uint32_t frames) override { bufferSize = frames; }

    AudioFormat streamFormat() const override { return m_format; }
    std::string deviceName() const override { return "Fake Output"; }
    QString errorString() const override { return m_error; }
    std::vector<AudioDevice> enumerateDevices() const override { return devices; }

    // Runs one host cycle and returns the bytes the engine produced
    std::vector<uint8_t> render(int frames)
    {
        std::vector<uint8_t> out((size_t)frames * m_format.frameSize(), 0xAB);
        if (m_render) m_render(out.data(), frames);
        return out;
    }

    std::vector<float> renderF32(int frames)
    {
        std::vector<uint8_t> bytes = render(frames);
        std::vector<float> samples(bytes.size() / sizeof(float));
        std::memcpy(samples.data(), bytes.data(), samples.size() * sizeof(float));
        return samples;
    }

    void raiseError(const QString& message)
    {
        if (m_onError) m_onError(message);
    }

    std::vector<AudioDevice> devices;
    bool     failOpen = false;
    bool     failStart = false;
    int      openCount = 0;
    uint32_t lastDeviceId = 0;
    uint32_t bufferSize = 0;

private:
    AudioFormat    m_format;
    bool           m_open = false;
    bool           m_running = false;
    QString        m_error;
    RenderCallback m_render;
    ErrorCallback  m_onError;
};

// ── FakeDecoder ─────────────────────────────────────────────────────
// Serves a fixed interleaved signal in packets.
class FakeDecoder : public IDecoder {
public:
    FakeDecoder(const AudioFormat& format, std::vector<double> samples, size_t packetFrames = 4096)
        : m_format(format)
        , m_samples(std::move(samples))
        , m_packetFrames(packetFrames)
    {
    }

    bool open(const QString&) override
    {
        if (failOpen) {
            m_error = AudioError(AudioError::Decoding, QStringLiteral("fake decoder refused file"));
            return false;
        }
        m_open = true;
        m_pos = 0;
        return true;
    }

    void close() override { m_open = false; }
    bool isOpen() const override { return m_open; }
    AudioFormat format() const override { return m_format; }
    std::optional<uint64_t> duration() const override { return totalFrames(); }

    bool seek(uint64_t frame) override
    {
        m_pos = std::min<uint64_t>(frame, totalFrames());
        m_error = AudioError();
        return true;
    }

    std::optional<DecodedPacket> decodeNext() override
    {
        m_error = AudioError();
        if (!m_open || m_pos >= totalFrames())
            return std::nullopt;

        const size_t ch = (size_t)m_format.channels;
        const size_t n = std::min<size_t>(m_packetFrames, totalFrames() - m_pos);
        DecodedPacket p;
        p.frames = n;
        p.format = m_format;
        auto first = m_samples.begin() + (std::ptrdiff_t)(m_pos * ch);
        p.samples.assign(first, first + (std::ptrdiff_t)(n * ch));
        m_pos += n;
        return p;
    }

    QString codecName() const override { return QStringLiteral("fake"); }
    AudioError lastError() const override { return m_error; }

    uint64_t totalFrames() const { return m_samples.size() / (size_t)m_format.channels; }

    bool failOpen = false;

private:
    AudioFormat         m_format;
    std::vector<double> m_samples;
    size_t              m_packetFrames;
    uint64_t            m_pos = 0;
    bool                m_open = false;
    AudioError          m_error;
};

// ── GatedDecoder ────────────────────────────────────────────────────
// Hands out `freePackets` packets, then blocks in decodeNext() until the
// gate opens. Lets tests starve the decode thread on purpose. The gate must
// be opened before the engine or streamer owning the decoder is destroyed.
struct DecoderGate {
    std::atomic<bool> open{false};
    std::atomic<bool> waiting{false};

    // Decoder is parked on the gate
    bool waitUntilBlocked(int timeoutMs = 5000) const
    {
        for (int i = 0; i < timeoutMs && !waiting.load(); ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return waiting.load();
    }
};

class GatedDecoder : public FakeDecoder {
public:
    GatedDecoder(const AudioFormat& format, std::vector<double> samples, size_t packetFrames,
                 int freePackets, std::shared_ptr<DecoderGate> gate)
        : FakeDecoder(format, std::move(samples), packetFrames)
        , m_freePackets(freePackets)
        , m_gate(std::move(gate))
    {
    }

    std::optional<DecodedPacket> decodeNext() override
    {
        if (++m_calls > m_freePackets) {
            m_gate->waiting = true;
            while (!m_gate->open.load())
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            m_gate->waiting = false;
        }
        return FakeDecoder::decodeNext();
    }

private:
    int m_freePackets;
    int m_calls = 0;
    std::shared_ptr<DecoderGate> m_gate;
};

// Frame i of channel c is (i % 1000) / 1000 + c / 10000, so positions can be
// read back from rendered output.
inline std::vector<double> makeIndexedSignal(size_t frames, int channels)
{
    std::vector<double> s(frames * (size_t)channels);
    for (size_t i = 0; i < frames; ++i)
        for (int c = 0; c < channels; ++c)
            s[i * (size_t)channels + (size_t)c] = (double)(i % 1000) / 1000.0 + c / 10000.0;
    return s;
}
