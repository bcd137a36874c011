#include "Ditherer.h"

#include <cmath>

Ditherer::Ditherer(DitherAlgorithm algorithm, uint64_t seed)
    : m_algorithm(algorithm)
    , m_state(seed)
{
}

double Ditherer::lsb(int targetBits)
{
    if (targetBits <= 1) return 1.0;
    return 1.0 / std::ldexp(1.0, targetBits - 1);
}

double Ditherer::nextUniform()
{
    // Knuth MMIX LCG
    m_state = m_state * 6364136223846793005ULL + 1442695040888963407ULL;
    // Top 53 bits give a double in [0, 1)
    double u = (double)(m_state >> 11) * (1.0 / 9007199254740992.0);
    return u - 0.5;
}

void Ditherer::apply(double* samples, size_t count, int targetBits)
{
    if (m_algorithm == DitherAlgorithm::None || count == 0)
        return;

    const double step = lsb(targetBits);

    if (m_algorithm == DitherAlgorithm::Rectangular) {
        for (size_t i = 0; i < count; ++i)
            samples[i] += nextUniform() * step;
    } else {
        for (size_t i = 0; i < count; ++i) {
            double a = nextUniform();
            double b = nextUniform();
            samples[i] += (a + b) * step;
        }
    }
}

void Ditherer::applyForFormat(double* samples, size_t count, SampleFormat target)
{
    if (SampleFormats::isFloat(target))
        return;
    apply(samples, count, SampleFormats::bitsPerSample(target));
}

DitherAlgorithm Ditherer::algorithmFromString(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("none") || n == QLatin1String("off"))
        return DitherAlgorithm::None;
    if (n == QLatin1String("rectangular") || n == QLatin1String("rpdf"))
        return DitherAlgorithm::Rectangular;
    return DitherAlgorithm::Triangular;
}

QString Ditherer::algorithmName(DitherAlgorithm algorithm)
{
    switch (algorithm) {
    case DitherAlgorithm::None:        return QStringLiteral("none");
    case DitherAlgorithm::Rectangular: return QStringLiteral("rectangular");
    case DitherAlgorithm::Triangular:  return QStringLiteral("triangular");
    }
    return QString();
}
