#pragma once

#include <soxr.h>
#include <QString>
#include <cstdint>
#include <vector>

// Sample-rate conversion of interleaved canonical samples.
//
// resampleLinear() is the stateless one-shot form. A Resampler instance keeps
// state between calls so packet boundaries do not click: Linear carries the
// last input frame and the fractional read position forward, High hands the
// stream to libsoxr.
class Resampler {
public:
    enum class Quality {
        Linear,     // interpolation, not band-limited
        High,       // SOXR_HQ
    };

    Resampler(uint32_t sourceRate, uint32_t targetRate, int channels,
              Quality quality = Quality::High);
    ~Resampler();

    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    // False when soxr could not be created; lastError() explains
    bool isValid() const { return m_valid; }
    QString lastError() const { return m_error; }

    uint32_t sourceRate() const { return m_sourceRate; }
    uint32_t targetRate() const { return m_targetRate; }
    int channels() const { return m_channels; }
    Quality quality() const { return m_quality; }
    double ratio() const { return (double)m_targetRate / (double)m_sourceRate; }
    bool isPassthrough() const { return m_sourceRate == m_targetRate; }

    // Appends converted frames to `output`. Returns frames appended.
    size_t process(const double* input, size_t frames, std::vector<double>& output);

    // Drain anything held back (soxr filter delay). Linear has nothing left.
    size_t flush(std::vector<double>& output);

    // Forget history, e.g. after a seek
    void reset();

    // floor((frames - 1) * ratio) + 1 output frames; identity when ratio == 1
    static std::vector<double> resampleLinear(const std::vector<double>& interleaved,
                                              int channels,
                                              uint32_t sourceRate,
                                              uint32_t targetRate);

    static Quality qualityFromString(const QString& name);

private:
    bool createSoxr();
    void destroySoxr();
    size_t processLinear(const double* input, size_t frames, std::vector<double>& output);

    uint32_t m_sourceRate;
    uint32_t m_targetRate;
    int m_channels;
    Quality m_quality;
    bool m_valid = true;
    QString m_error;

    soxr_t m_soxr = nullptr;

    // Linear streaming state
    std::vector<double> m_prevFrame;
    bool m_havePrev = false;
    double m_position = 0.0;    // next output position, in input frames relative to m_prevFrame
};
