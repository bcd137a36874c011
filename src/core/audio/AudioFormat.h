#pragma once

#include <QString>
#include <cstdint>
#include <cstddef>
#include <optional>

enum class SampleFormat {
    U8,
    I8,
    U16,
    I16,
    I24,    // signed, packed in 3 little-endian bytes
    I32,
    F32,
    F64,
};

enum class ChannelLayout {
    Mono,
    Stereo,
    Surround21,
    Surround51,
    Surround71,
};

namespace SampleFormats {
size_t sizeBytes(SampleFormat format);
int bitsPerSample(SampleFormat format);
inline bool isFloat(SampleFormat format) { return format == SampleFormat::F32 || format == SampleFormat::F64; }
inline bool isInteger(SampleFormat format) { return !isFloat(format); }
QString name(SampleFormat format);
}

namespace ChannelLayouts {
std::optional<ChannelLayout> fromChannelCount(int channels);
int channelCount(ChannelLayout layout);
QString name(ChannelLayout layout);
}

struct AudioFormat {
    static constexpr uint32_t kMaxSampleRate = 192000;
    static constexpr int      kMaxChannels   = 32;

    uint32_t     sampleRate   = 44100;
    int          channels     = 2;
    SampleFormat sampleFormat = SampleFormat::F32;
    std::optional<ChannelLayout> channelLayout = ChannelLayout::Stereo;

    AudioFormat() = default;
    AudioFormat(uint32_t rate, int ch, SampleFormat fmt)
        : sampleRate(rate)
        , channels(ch)
        , sampleFormat(fmt)
        , channelLayout(ChannelLayouts::fromChannelCount(ch))
    {
    }

    size_t frameSize() const { return static_cast<size_t>(channels) * SampleFormats::sizeBytes(sampleFormat); }
    uint64_t byteRate() const { return static_cast<uint64_t>(sampleRate) * frameSize(); }

    // Same rate and channel count; sample encoding may differ
    bool isCompatibleWith(const AudioFormat& other) const {
        return sampleRate == other.sampleRate && channels == other.channels;
    }

    // >= 48 kHz, or anything deeper/other than 16-bit PCM
    bool isHighResolution() const {
        return sampleRate >= 48000 || sampleFormat != SampleFormat::I16;
    }

    // Returns an empty string when valid, otherwise a human-readable reason
    QString validate() const;
    bool isValid() const { return validate().isEmpty(); }

    QString toString() const;

    bool operator==(const AudioFormat& o) const {
        return sampleRate == o.sampleRate && channels == o.channels
            && sampleFormat == o.sampleFormat && channelLayout == o.channelLayout;
    }
    bool operator!=(const AudioFormat& o) const { return !(*this == o); }
};
