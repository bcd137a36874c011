#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "AudioFormat.h"

// Fully decoded track in the canonical domain. Immutable and cheap to copy:
// copies share the same sample storage.
class AudioBuffer {
public:
    AudioBuffer() = default;
    AudioBuffer(std::vector<double> interleaved, const AudioFormat& format);

    const AudioFormat& format() const { return m_format; }
    const std::vector<double>& samples() const;
    const double* data() const { return samples().data(); }

    bool isEmpty() const { return sampleCount() == 0; }
    size_t sampleCount() const { return m_samples ? m_samples->size() : 0; }
    size_t frames() const;
    double durationSeconds() const;

    // De-interleaved copy of one channel; empty if out of range
    std::vector<double> channelData(int channel) const;

    // Frames [startFrame, startFrame + frameCount), clipped to the buffer
    AudioBuffer slice(size_t startFrame, size_t frameCount) const;

    std::vector<int16_t> toI16() const;
    std::vector<int32_t> toI32() const;
    std::vector<float>   toF32() const;

private:
    std::shared_ptr<const std::vector<double>> m_samples;
    AudioFormat m_format;
};

// One unit of decoder output
struct DecodedPacket {
    std::vector<double> samples;   // canonical, interleaved
    size_t frames = 0;
    AudioFormat format;
};
