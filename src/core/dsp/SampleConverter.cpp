#include "SampleConverter.h"

#include <QtEndian>
#include <algorithm>
#include <cstring>

namespace SampleConverter {

namespace {

constexpr double kI24Scale = 8388608.0;      // 2^23

inline double clampUnit(double c) { return std::clamp(c, -1.0, 1.0); }

template <typename T>
inline T loadLE(const uint8_t* p)
{
    T v;
    std::memcpy(&v, p, sizeof(T));
    return qFromLittleEndian(v);
}

template <typename T>
inline void storeLE(T v, uint8_t* p)
{
    v = qToLittleEndian(v);
    std::memcpy(p, &v, sizeof(T));
}

} // namespace

// ── single samples ──────────────────────────────────────────────────
double i16ToCanonical(int16_t s)
{
    return (double)s / 32767.0;
}

int16_t canonicalToI16(double c)
{
    return static_cast<int16_t>(clampUnit(c) * 32767.0);
}

double i24ToCanonical(const uint8_t* b)
{
    int32_t v = (int32_t)b[0] | ((int32_t)b[1] << 8) | ((int32_t)b[2] << 16);
    if (v & 0x800000) v |= ~0xFFFFFF;   // sign-extend
    return (double)v / kI24Scale;
}

void canonicalToI24(double c, uint8_t* b)
{
    // Exact inverse of i24ToCanonical; +1.0 saturates at 0x7FFFFF
    auto v = std::clamp(static_cast<int32_t>(clampUnit(c) * kI24Scale), -8388608, 8388607);
    b[0] = static_cast<uint8_t>(v & 0xFF);
    b[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    b[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
}

// ── pointer API ─────────────────────────────────────────────────────
void toCanonical(const uint8_t* src, double* dst, size_t count, SampleFormat format)
{
    const size_t step = SampleFormats::sizeBytes(format);
    for (size_t i = 0; i < count; ++i, src += step) {
        switch (format) {
        case SampleFormat::U8:
            dst[i] = ((double)*src / 255.0) * 2.0 - 1.0;
            break;
        case SampleFormat::I8:
            dst[i] = (double)(int8_t)*src / 127.0;
            break;
        case SampleFormat::U16:
            dst[i] = ((double)loadLE<uint16_t>(src) / 65535.0) * 2.0 - 1.0;
            break;
        case SampleFormat::I16:
            dst[i] = i16ToCanonical(loadLE<int16_t>(src));
            break;
        case SampleFormat::I24:
            dst[i] = i24ToCanonical(src);
            break;
        case SampleFormat::I32:
            dst[i] = (double)loadLE<int32_t>(src) / 2147483647.0;
            break;
        case SampleFormat::F32: {
            uint32_t bits = loadLE<uint32_t>(src);
            float f;
            std::memcpy(&f, &bits, sizeof(f));
            dst[i] = f;
            break;
        }
        case SampleFormat::F64: {
            uint64_t bits = loadLE<uint64_t>(src);
            std::memcpy(&dst[i], &bits, sizeof(double));
            break;
        }
        }
    }
}

void fromCanonical(const double* src, uint8_t* dst, size_t count, SampleFormat format)
{
    const size_t step = SampleFormats::sizeBytes(format);
    for (size_t i = 0; i < count; ++i, dst += step) {
        const double c = src[i];
        switch (format) {
        case SampleFormat::U8:
            *dst = static_cast<uint8_t>((clampUnit(c) + 1.0) * 0.5 * 255.0);
            break;
        case SampleFormat::I8:
            *dst = static_cast<uint8_t>(static_cast<int8_t>(clampUnit(c) * 127.0));
            break;
        case SampleFormat::U16:
            storeLE(static_cast<uint16_t>((clampUnit(c) + 1.0) * 0.5 * 65535.0), dst);
            break;
        case SampleFormat::I16:
            storeLE(canonicalToI16(c), dst);
            break;
        case SampleFormat::I24:
            canonicalToI24(c, dst);
            break;
        case SampleFormat::I32:
            storeLE(static_cast<int32_t>(clampUnit(c) * 2147483647.0), dst);
            break;
        case SampleFormat::F32: {
            float f = static_cast<float>(c);
            uint32_t bits;
            std::memcpy(&bits, &f, sizeof(bits));
            storeLE(bits, dst);
            break;
        }
        case SampleFormat::F64: {
            uint64_t bits;
            std::memcpy(&bits, &c, sizeof(bits));
            storeLE(bits, dst);
            break;
        }
        }
    }
}

// ── byte API ────────────────────────────────────────────────────────
std::optional<std::vector<double>> toCanonical(const std::vector<uint8_t>& bytes,
                                               SampleFormat format,
                                               AudioError* error)
{
    const size_t step = SampleFormats::sizeBytes(format);
    if (bytes.size() % step != 0) {
        if (error) {
            *error = AudioError(AudioError::AudioFormat,
                                QStringLiteral("Byte length %1 is not a multiple of %2 (%3)")
                                    .arg(bytes.size()).arg(step)
                                    .arg(SampleFormats::name(format)));
        }
        return std::nullopt;
    }

    std::vector<double> out(bytes.size() / step);
    toCanonical(bytes.data(), out.data(), out.size(), format);
    return out;
}

std::vector<uint8_t> fromCanonical(const std::vector<double>& samples, SampleFormat format)
{
    std::vector<uint8_t> out(samples.size() * SampleFormats::sizeBytes(format));
    fromCanonical(samples.data(), out.data(), samples.size(), format);
    return out;
}

} // namespace SampleConverter
