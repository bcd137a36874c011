#pragma once

#include <QString>
#include <cstdint>
#include <vector>

// Fingerprints of decoded sample data for bit-perfect verification.
// Integer samples are hashed as little-endian bytes, floats by their bit
// pattern, so results are stable across platforms.
struct AudioChecksum {
    enum Algorithm {
        Simple,     // FNV-1a 64, fast
        Crc32,
        Md5,
        Sha256,
    };

    Algorithm algorithm = Simple;
    QString   value;               // lower-case hex
    size_t    sampleCount = 0;

    bool operator==(const AudioChecksum& o) const {
        return algorithm == o.algorithm && value == o.value && sampleCount == o.sampleCount;
    }
    bool operator!=(const AudioChecksum& o) const { return !(*this == o); }

    static AudioChecksum calculate(const std::vector<int16_t>& samples, Algorithm algorithm);
    static AudioChecksum calculate(const std::vector<float>& samples, Algorithm algorithm);
    static AudioChecksum calculate(const std::vector<double>& samples, Algorithm algorithm);

    // Same algorithm, same value, same sample count
    static bool verify(const AudioChecksum& a, const AudioChecksum& b) { return a == b; }

    static QString algorithmName(Algorithm algorithm);
};

struct AudioStats {
    size_t  sampleCount = 0;
    double  rms = 0.0;          // normalized by 32767
    int16_t peak = 0;           // largest magnitude, saturated at 32767
    int16_t min = 0;
    int16_t max = 0;
    double  average = 0.0;

    static AudioStats calculate(const std::vector<int16_t>& samples);
};

namespace AudioAnalysis {
double rms(const std::vector<int16_t>& samples);
int16_t peak(const std::vector<int16_t>& samples);
}
