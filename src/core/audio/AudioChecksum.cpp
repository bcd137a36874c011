#include "AudioChecksum.h"

#include <QByteArray>
#include <QCryptographicHash>
#include <QtEndian>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace {

// Flattens samples into little-endian bytes
QByteArray toBytes(const std::vector<int16_t>& samples)
{
    QByteArray bytes(int(samples.size() * sizeof(int16_t)), Qt::Uninitialized);
    auto* p = reinterpret_cast<uchar*>(bytes.data());
    for (size_t i = 0; i < samples.size(); ++i)
        qToLittleEndian<int16_t>(samples[i], p + i * sizeof(int16_t));
    return bytes;
}

QByteArray toBytes(const std::vector<float>& samples)
{
    QByteArray bytes(int(samples.size() * sizeof(uint32_t)), Qt::Uninitialized);
    auto* p = reinterpret_cast<uchar*>(bytes.data());
    for (size_t i = 0; i < samples.size(); ++i) {
        uint32_t bits;
        std::memcpy(&bits, &samples[i], sizeof(bits));
        qToLittleEndian<uint32_t>(bits, p + i * sizeof(uint32_t));
    }
    return bytes;
}

QByteArray toBytes(const std::vector<double>& samples)
{
    QByteArray bytes(int(samples.size() * sizeof(uint64_t)), Qt::Uninitialized);
    auto* p = reinterpret_cast<uchar*>(bytes.data());
    for (size_t i = 0; i < samples.size(); ++i) {
        uint64_t bits;
        std::memcpy(&bits, &samples[i], sizeof(bits));
        qToLittleEndian<uint64_t>(bits, p + i * sizeof(uint64_t));
    }
    return bytes;
}

uint64_t fnv1a64(const QByteArray& data)
{
    uint64_t h = 0xcbf29ce484222325ULL;
    for (char c : data) {
        h ^= static_cast<uint8_t>(c);
        h *= 0x100000001b3ULL;
    }
    return h;
}

// IEEE 802.3, reflected
uint32_t crc32(const QByteArray& data)
{
    static const std::array<uint32_t, 256> table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int k = 0; k < 8; ++k)
                c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
            t[i] = c;
        }
        return t;
    }();

    uint32_t crc = 0xFFFFFFFFu;
    for (char c : data)
        crc = table[(crc ^ static_cast<uint8_t>(c)) & 0xFF] ^ (crc >> 8);
    return crc ^ 0xFFFFFFFFu;
}

AudioChecksum digest(const QByteArray& bytes, size_t count, AudioChecksum::Algorithm algorithm)
{
    AudioChecksum sum;
    sum.algorithm = algorithm;
    sum.sampleCount = count;

    switch (algorithm) {
    case AudioChecksum::Simple:
        sum.value = QStringLiteral("%1").arg(fnv1a64(bytes), 16, 16, QLatin1Char('0'));
        break;
    case AudioChecksum::Crc32:
        sum.value = QStringLiteral("%1").arg(crc32(bytes), 8, 16, QLatin1Char('0'));
        break;
    case AudioChecksum::Md5:
        sum.value = QString::fromLatin1(
            QCryptographicHash::hash(bytes, QCryptographicHash::Md5).toHex());
        break;
    case AudioChecksum::Sha256:
        sum.value = QString::fromLatin1(
            QCryptographicHash::hash(bytes, QCryptographicHash::Sha256).toHex());
        break;
    }
    return sum;
}

} // namespace

AudioChecksum AudioChecksum::calculate(const std::vector<int16_t>& samples, Algorithm algorithm)
{
    return digest(toBytes(samples), samples.size(), algorithm);
}

AudioChecksum AudioChecksum::calculate(const std::vector<float>& samples, Algorithm algorithm)
{
    return digest(toBytes(samples), samples.size(), algorithm);
}

AudioChecksum AudioChecksum::calculate(const std::vector<double>& samples, Algorithm algorithm)
{
    return digest(toBytes(samples), samples.size(), algorithm);
}

QString AudioChecksum::algorithmName(Algorithm algorithm)
{
    switch (algorithm) {
    case Simple: return QStringLiteral("simple");
    case Crc32:  return QStringLiteral("crc32");
    case Md5:    return QStringLiteral("md5");
    case Sha256: return QStringLiteral("sha256");
    }
    return QString();
}

// ── analysis ────────────────────────────────────────────────────────
namespace AudioAnalysis {

double rms(const std::vector<int16_t>& samples)
{
    if (samples.empty()) return 0.0;
    double sum = 0.0;
    for (int16_t s : samples) {
        double n = (double)s / 32767.0;
        sum += n * n;
    }
    return std::sqrt(sum / (double)samples.size());
}

int16_t peak(const std::vector<int16_t>& samples)
{
    int p = 0;
    for (int16_t s : samples)
        p = std::max(p, std::abs((int)s));
    return (int16_t)std::min(p, 32767);
}

} // namespace AudioAnalysis

AudioStats AudioStats::calculate(const std::vector<int16_t>& samples)
{
    AudioStats stats;
    if (samples.empty()) return stats;

    stats.sampleCount = samples.size();
    stats.rms = AudioAnalysis::rms(samples);
    stats.peak = AudioAnalysis::peak(samples);
    auto mm = std::minmax_element(samples.begin(), samples.end());
    stats.min = *mm.first;
    stats.max = *mm.second;

    double sum = 0.0;
    for (int16_t s : samples) sum += s;
    stats.average = sum / (double)samples.size();
    return stats;
}
