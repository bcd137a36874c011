#pragma once

#include <cstddef>
#include <vector>

#include "../audio/AudioFormat.h"

// Volume stage of the canonical pipeline.
//
// setVolumeRamped() spreads a change over rate * ms / 1000 samples. The ramp
// advances once per sample (not per frame), which is what the render callback
// relies on for click-free fades.
class AudioProcessor {
public:
    static constexpr double kMinDb = -60.0;

    explicit AudioProcessor(const AudioFormat& format = AudioFormat());

    const AudioFormat& format() const { return m_format; }
    void setFormat(const AudioFormat& format) { m_format = format; }

    // Immediate; cancels any ramp in progress
    void setVolume(double volume);

    // ms <= 0 behaves like setVolume()
    void setVolumeRamped(double target, int durationMs);

    double volume() const { return m_volume; }
    double targetVolume() const { return m_targetVolume; }
    double rampStep() const { return m_rampStep; }
    bool isRamping() const { return m_volume != m_targetVolume; }

    // Multiply each sample by the current volume, advancing the ramp
    void applyVolume(double* samples, size_t count);
    void applyVolume(std::vector<double>& samples) { applyVolume(samples.data(), samples.size()); }

    // Stateless scale; volume is clamped to [0, 1]
    static void applyVolumeStatic(double* samples, size_t count, double volume);
    static void applyVolumeStatic(std::vector<double>& samples, double volume) {
        applyVolumeStatic(samples.data(), samples.size(), volume);
    }

    static double dbToLinear(double db);
    static double linearToDb(double linear);

private:
    AudioFormat m_format;
    double m_volume = 1.0;
    double m_targetVolume = 1.0;
    double m_rampStep = 0.0;
};
