#pragma once
#include <memory>
#include <QString>
#include "IDecoder.h"

// FFmpeg-backed decoder. Every stream is converted by libswresample to
// interleaved double at its native rate and channel count.
class AudioDecoder : public IDecoder {
public:
    // Frames handed out per decodeNext() at most
    static constexpr int kPacketFrames = 4096;

    AudioDecoder();
    ~AudioDecoder() override;

    AudioDecoder(const AudioDecoder&) = delete;
    AudioDecoder& operator=(const AudioDecoder&) = delete;

    bool open(const QString& filePath) override;
    void close() override;
    bool isOpen() const override;

    AudioFormat format() const override;
    std::optional<uint64_t> duration() const override;
    bool seek(uint64_t frame) override;
    std::optional<DecodedPacket> decodeNext() override;

    // Returns the FFmpeg codec name (e.g. "flac", "mp3") or empty if not loaded
    QString codecName() const override;

    AudioError lastError() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};
