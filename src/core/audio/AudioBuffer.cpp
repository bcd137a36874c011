#include "AudioBuffer.h"

#include <algorithm>

#include "../dsp/SampleConverter.h"

AudioBuffer::AudioBuffer(std::vector<double> interleaved, const AudioFormat& format)
    : m_samples(std::make_shared<const std::vector<double>>(std::move(interleaved)))
    , m_format(format)
{
}

const std::vector<double>& AudioBuffer::samples() const
{
    static const std::vector<double> kEmpty;
    return m_samples ? *m_samples : kEmpty;
}

size_t AudioBuffer::frames() const
{
    if (m_format.channels <= 0) return 0;
    return sampleCount() / static_cast<size_t>(m_format.channels);
}

double AudioBuffer::durationSeconds() const
{
    if (m_format.sampleRate == 0) return 0.0;
    return (double)frames() / (double)m_format.sampleRate;
}

std::vector<double> AudioBuffer::channelData(int channel) const
{
    if (channel < 0 || channel >= m_format.channels)
        return {};

    const size_t ch = static_cast<size_t>(m_format.channels);
    const auto& s = samples();
    std::vector<double> out;
    out.reserve(frames());
    for (size_t i = static_cast<size_t>(channel); i < s.size(); i += ch)
        out.push_back(s[i]);
    return out;
}

AudioBuffer AudioBuffer::slice(size_t startFrame, size_t frameCount) const
{
    const size_t total = frames();
    const size_t start = std::min(startFrame, total);
    const size_t count = std::min(frameCount, total - start);
    const size_t ch = static_cast<size_t>(std::max(m_format.channels, 0));

    const auto& s = samples();
    auto first = s.begin() + static_cast<std::ptrdiff_t>(start * ch);
    return AudioBuffer(std::vector<double>(first, first + static_cast<std::ptrdiff_t>(count * ch)),
                       m_format);
}

std::vector<int16_t> AudioBuffer::toI16() const
{
    const auto& s = samples();
    std::vector<int16_t> out(s.size());
    std::transform(s.begin(), s.end(), out.begin(), SampleConverter::canonicalToI16);
    return out;
}

std::vector<int32_t> AudioBuffer::toI32() const
{
    const auto& s = samples();
    std::vector<int32_t> out(s.size());
    std::transform(s.begin(), s.end(), out.begin(), [](double c) {
        return static_cast<int32_t>(std::clamp(c, -1.0, 1.0) * 2147483647.0);
    });
    return out;
}

std::vector<float> AudioBuffer::toF32() const
{
    const auto& s = samples();
    return std::vector<float>(s.begin(), s.end());
}
