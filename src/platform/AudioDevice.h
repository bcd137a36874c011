#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include "../core/audio/AudioFormat.h"

// One contiguous block of configurations a device accepts
struct SupportedConfigRange {
    uint32_t     minSampleRate = 0;
    uint32_t     maxSampleRate = 0;
    int          channels      = 0;
    SampleFormat sampleFormat  = SampleFormat::F32;

    bool containsRate(uint32_t rate) const { return rate >= minSampleRate && rate <= maxSampleRate; }
};

struct AudioDevice {
    uint32_t    deviceId  = 0;      // 0 is reserved for "system default"
    std::string name;
    std::string systemName;         // host handle, e.g. "hw:1,0" on ALSA
    bool        isDefault = false;
    std::vector<SupportedConfigRange> configRanges;
};
