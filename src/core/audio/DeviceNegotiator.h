#pragma once

#include <optional>
#include <vector>

#include "AudioError.h"
#include "AudioFormat.h"
#include "../../platform/AudioDevice.h"

// Picks the device configuration best suited to play a source format.
//
// A range is only compatible when it contains the source rate and matches
// the channel count exactly. Among compatible ranges the highest score wins:
//   +100  rate inside the range
//   +10   rate sits exactly on a range boundary
//   +50   channel count matches
//   +5    source is high-res and the range reaches 96 kHz
//   +1    per common rate (44.1/48/96/192 kHz) the range covers
//   +0..3 native precision of the range's sample format
// Ties keep the earlier range.
class DeviceNegotiator {
public:
    struct Result {
        AudioFormat          format;        // what to open the stream with
        SupportedConfigRange range;
        int                  score = 0;
    };

    static int score(const SupportedConfigRange& range, const AudioFormat& target);
    static bool isCompatible(const SupportedConfigRange& range, const AudioFormat& target);

    static std::optional<Result> negotiate(const std::vector<SupportedConfigRange>& ranges,
                                           const AudioFormat& target,
                                           AudioError* error = nullptr);

    // When nothing matches the source rate: the supported rate nearest to it
    // among ranges with the right channel count, preferring a higher rate on
    // ties. Used to set up a resampling fallback.
    static std::optional<uint32_t> nearestSupportedRate(const std::vector<SupportedConfigRange>& ranges,
                                                        const AudioFormat& target);

private:
    static int precisionBonus(SampleFormat format);
};
