#include "AudioFormat.h"

namespace SampleFormats {

size_t sizeBytes(SampleFormat format)
{
    switch (format) {
    case SampleFormat::U8:
    case SampleFormat::I8:  return 1;
    case SampleFormat::U16:
    case SampleFormat::I16: return 2;
    case SampleFormat::I24: return 3;
    case SampleFormat::I32:
    case SampleFormat::F32: return 4;
    case SampleFormat::F64: return 8;
    }
    return 0;
}

int bitsPerSample(SampleFormat format)
{
    return static_cast<int>(sizeBytes(format)) * 8;
}

QString name(SampleFormat format)
{
    switch (format) {
    case SampleFormat::U8:  return QStringLiteral("U8");
    case SampleFormat::I8:  return QStringLiteral("I8");
    case SampleFormat::U16: return QStringLiteral("U16");
    case SampleFormat::I16: return QStringLiteral("I16");
    case SampleFormat::I24: return QStringLiteral("I24");
    case SampleFormat::I32: return QStringLiteral("I32");
    case SampleFormat::F32: return QStringLiteral("F32");
    case SampleFormat::F64: return QStringLiteral("F64");
    }
    return QStringLiteral("?");
}

} // namespace SampleFormats

namespace ChannelLayouts {

std::optional<ChannelLayout> fromChannelCount(int channels)
{
    switch (channels) {
    case 1: return ChannelLayout::Mono;
    case 2: return ChannelLayout::Stereo;
    case 3: return ChannelLayout::Surround21;
    case 6: return ChannelLayout::Surround51;
    case 8: return ChannelLayout::Surround71;
    default: return std::nullopt;
    }
}

int channelCount(ChannelLayout layout)
{
    switch (layout) {
    case ChannelLayout::Mono:       return 1;
    case ChannelLayout::Stereo:     return 2;
    case ChannelLayout::Surround21: return 3;
    case ChannelLayout::Surround51: return 6;
    case ChannelLayout::Surround71: return 8;
    }
    return 0;
}

QString name(ChannelLayout layout)
{
    switch (layout) {
    case ChannelLayout::Mono:       return QStringLiteral("Mono");
    case ChannelLayout::Stereo:     return QStringLiteral("Stereo");
    case ChannelLayout::Surround21: return QStringLiteral("2.1");
    case ChannelLayout::Surround51: return QStringLiteral("5.1");
    case ChannelLayout::Surround71: return QStringLiteral("7.1");
    }
    return QString();
}

} // namespace ChannelLayouts

QString AudioFormat::validate() const
{
    if (sampleRate == 0 || sampleRate > kMaxSampleRate)
        return QStringLiteral("Invalid sample rate: %1 Hz").arg(sampleRate);
    if (channels < 1 || channels > kMaxChannels)
        return QStringLiteral("Invalid channel count: %1").arg(channels);
    if (channelLayout && ChannelLayouts::channelCount(*channelLayout) != channels)
        return QStringLiteral("Channel layout %1 does not match %2 channels")
            .arg(ChannelLayouts::name(*channelLayout)).arg(channels);
    return QString();
}

QString AudioFormat::toString() const
{
    return QStringLiteral("%1 Hz, %2 ch, %3")
        .arg(sampleRate)
        .arg(channels)
        .arg(SampleFormats::name(sampleFormat));
}
