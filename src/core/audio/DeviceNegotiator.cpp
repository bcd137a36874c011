#include "DeviceNegotiator.h"

#include <QDebug>
#include <cstdlib>

namespace {
constexpr uint32_t kCommonRates[] = { 44100, 48000, 96000, 192000 };
}

int DeviceNegotiator::precisionBonus(SampleFormat format)
{
    switch (format) {
    case SampleFormat::F64:
    case SampleFormat::F32:
    case SampleFormat::I32: return 3;
    case SampleFormat::I24: return 2;
    case SampleFormat::I16:
    case SampleFormat::U16: return 1;
    default:                return 0;
    }
}

bool DeviceNegotiator::isCompatible(const SupportedConfigRange& range, const AudioFormat& target)
{
    return range.containsRate(target.sampleRate) && range.channels == target.channels;
}

int DeviceNegotiator::score(const SupportedConfigRange& range, const AudioFormat& target)
{
    int s = 0;

    if (range.containsRate(target.sampleRate)) {
        s += 100;
        if (target.sampleRate == range.minSampleRate || target.sampleRate == range.maxSampleRate)
            s += 10;
    }

    if (range.channels == target.channels)
        s += 50;

    if (target.isHighResolution() && range.maxSampleRate >= 96000)
        s += 5;

    for (uint32_t rate : kCommonRates) {
        if (range.containsRate(rate))
            s += 1;
    }

    s += precisionBonus(range.sampleFormat);
    return s;
}

std::optional<DeviceNegotiator::Result>
DeviceNegotiator::negotiate(const std::vector<SupportedConfigRange>& ranges,
                            const AudioFormat& target,
                            AudioError* error)
{
    std::optional<Result> best;

    for (const auto& range : ranges) {
        if (!isCompatible(range, target))
            continue;
        int s = score(range, target);
        if (!best || s > best->score) {
            Result r;
            r.range = range;
            r.score = s;
            r.format = AudioFormat(target.sampleRate, target.channels, range.sampleFormat);
            best = r;
        }
    }

    if (!best) {
        QString msg = QStringLiteral("No supported device configuration for %1")
                          .arg(target.toString());
        qWarning() << "[Negotiator]" << msg;
        if (error) *error = AudioError(AudioError::AudioFormat, msg);
        return std::nullopt;
    }

    qDebug() << "[Negotiator] Chose" << best->format.toString() << "score" << best->score;
    return best;
}

std::optional<uint32_t>
DeviceNegotiator::nearestSupportedRate(const std::vector<SupportedConfigRange>& ranges,
                                       const AudioFormat& target)
{
    std::optional<uint32_t> best;
    long bestDist = 0;

    auto consider = [&](uint32_t rate) {
        long dist = std::labs((long)rate - (long)target.sampleRate);
        if (!best || dist < bestDist || (dist == bestDist && rate > *best)) {
            best = rate;
            bestDist = dist;
        }
    };

    for (const auto& range : ranges) {
        if (range.channels != target.channels || range.maxSampleRate == 0)
            continue;
        if (range.containsRate(target.sampleRate)) {
            consider(target.sampleRate);
            continue;
        }
        // Prefer a common rate inside the range, else its nearest edge
        bool anyCommon = false;
        for (uint32_t rate : kCommonRates) {
            if (range.containsRate(rate)) {
                consider(rate);
                anyCommon = true;
            }
        }
        if (!anyCommon)
            consider(target.sampleRate < range.minSampleRate ? range.minSampleRate
                                                             : range.maxSampleRate);
    }
    return best;
}
