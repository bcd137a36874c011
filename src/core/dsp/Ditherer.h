#pragma once

#include <QString>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "../audio/AudioFormat.h"

enum class DitherAlgorithm {
    None,
    Rectangular,    // RPDF, +-0.5 LSB
    Triangular,     // TPDF, sum of two RPDF draws
};

// Adds low-level noise ahead of integer narrowing so quantization error is
// decorrelated from the signal. Deterministic for a given seed.
class Ditherer {
public:
    static constexpr uint64_t kDefaultSeed = 0x853C49E6748FEA9BULL;

    explicit Ditherer(DitherAlgorithm algorithm = DitherAlgorithm::Triangular,
                      uint64_t seed = kDefaultSeed);

    DitherAlgorithm algorithm() const { return m_algorithm; }
    void setAlgorithm(DitherAlgorithm algorithm) { m_algorithm = algorithm; }
    void reseed(uint64_t seed) { m_state = seed; }

    void apply(double* samples, size_t count, int targetBits);
    void apply(std::vector<double>& samples, int targetBits) { apply(samples.data(), samples.size(), targetBits); }

    // No-op for float formats
    void applyForFormat(double* samples, size_t count, SampleFormat target);

    static double lsb(int targetBits);

    static DitherAlgorithm algorithmFromString(const QString& name);
    static QString algorithmName(DitherAlgorithm algorithm);

private:
    // Uniform in [-0.5, 0.5)
    double nextUniform();

    DitherAlgorithm m_algorithm;
    uint64_t m_state;
};
