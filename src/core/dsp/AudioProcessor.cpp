#include "AudioProcessor.h"

#include <algorithm>
#include <cmath>

AudioProcessor::AudioProcessor(const AudioFormat& format)
    : m_format(format)
{
}

void AudioProcessor::setVolume(double volume)
{
    m_volume = std::clamp(volume, 0.0, 1.0);
    m_targetVolume = m_volume;
    m_rampStep = 0.0;
}

void AudioProcessor::setVolumeRamped(double target, int durationMs)
{
    if (durationMs <= 0) {
        setVolume(target);
        return;
    }

    m_targetVolume = std::clamp(target, 0.0, 1.0);
    double rampSamples = (double)m_format.sampleRate * durationMs / 1000.0;
    m_rampStep = (m_targetVolume - m_volume) / std::max(1.0, rampSamples);
    if (m_rampStep == 0.0)
        m_volume = m_targetVolume;
}

void AudioProcessor::applyVolume(double* samples, size_t count)
{
    if (!isRamping()) {
        if (m_volume != 1.0) {
            for (size_t i = 0; i < count; ++i)
                samples[i] *= m_volume;
        }
        return;
    }

    for (size_t i = 0; i < count; ++i) {
        samples[i] *= m_volume;

        if (m_volume != m_targetVolume) {
            m_volume += m_rampStep;
            // Stop exactly on target; the tolerance absorbs accumulated
            // rounding so the ramp never runs one sample long
            const double remaining = m_targetVolume - m_volume;
            if (m_rampStep == 0.0
                || (m_rampStep > 0.0 && remaining <= std::abs(m_rampStep) * 1e-6)
                || (m_rampStep < 0.0 && remaining >= -std::abs(m_rampStep) * 1e-6)) {
                m_volume = m_targetVolume;
                m_rampStep = 0.0;
            }
        }
    }
}

void AudioProcessor::applyVolumeStatic(double* samples, size_t count, double volume)
{
    const double v = std::clamp(volume, 0.0, 1.0);
    for (size_t i = 0; i < count; ++i)
        samples[i] *= v;
}

double AudioProcessor::dbToLinear(double db)
{
    if (db <= kMinDb) return 0.0;
    return std::pow(10.0, db / 20.0);
}

double AudioProcessor::linearToDb(double linear)
{
    if (linear <= 0.0) return kMinDb;
    return 20.0 * std::log10(linear);
}
