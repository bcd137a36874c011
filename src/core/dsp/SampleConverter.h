#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "../audio/AudioError.h"
#include "../audio/AudioFormat.h"

// Conversion between packed little-endian PCM and the canonical domain
// (interleaved double in [-1.0, 1.0]).
//
// Integer narrowing clamps first and then truncates toward zero, so a
// round trip through an integer format is exact to within one LSB.
namespace SampleConverter {

// Byte-level API. Fails with an AudioFormat error when bytes.size() is not
// a multiple of the sample size.
std::optional<std::vector<double>> toCanonical(const std::vector<uint8_t>& bytes,
                                               SampleFormat format,
                                               AudioError* error = nullptr);
std::vector<uint8_t> fromCanonical(const std::vector<double>& samples, SampleFormat format);

// Non-allocating variants for the render thread. `src`/`dst` must hold
// count * sizeBytes(format) bytes.
void toCanonical(const uint8_t* src, double* dst, size_t count, SampleFormat format);
void fromCanonical(const double* src, uint8_t* dst, size_t count, SampleFormat format);

// Single-sample helpers
double i16ToCanonical(int16_t s);
int16_t canonicalToI16(double c);
double i24ToCanonical(const uint8_t* bytes);
void canonicalToI24(double c, uint8_t* bytes);

} // namespace SampleConverter
