#include "IDecoder.h"

#include <QDebug>
#include <QFileInfo>
#include <algorithm>
#include <new>
#include <stdexcept>

std::optional<AudioBuffer> IDecoder::decodeAll()
{
    if (!isOpen())
        return std::nullopt;

    // Header durations are only a hint; a placeholder or corrupt size must
    // not turn into a giant allocation
    constexpr uint64_t kMaxReserveSamples = (100ull * 1024 * 1024) / sizeof(double);

    std::vector<double> all;
    try {
        if (auto total = duration()) {
            const uint64_t channels = (uint64_t)std::max(1, format().channels);
            const uint64_t hint = *total > kMaxReserveSamples / channels ? kMaxReserveSamples
                                                                         : *total * channels;
            all.reserve(static_cast<size_t>(hint));
        }

        while (auto packet = decodeNext())
            all.insert(all.end(), packet->samples.begin(), packet->samples.end());
    } catch (const std::bad_alloc&) {
        qWarning() << "[Decoder] Out of memory decoding" << all.size() << "samples";
        return std::nullopt;
    } catch (const std::length_error&) {
        qWarning() << "[Decoder] Stream too long to decode into memory";
        return std::nullopt;
    }

    if (!lastError().message.isEmpty())
        return std::nullopt;
    return AudioBuffer(std::move(all), format());
}

namespace DecoderFormats {

QStringList supportedExtensions()
{
    return { QStringLiteral("mp3"), QStringLiteral("wav"), QStringLiteral("flac"),
             QStringLiteral("ogg"), QStringLiteral("m4a"), QStringLiteral("aac") };
}

bool isFormatSupported(const QString& path)
{
    return supportedExtensions().contains(QFileInfo(path).suffix().toLower());
}

QString formatNameFromExtension(const QString& path)
{
    const QString ext = QFileInfo(path).suffix().toLower();
    if (ext == QLatin1String("mp3"))  return QStringLiteral("MP3");
    if (ext == QLatin1String("wav"))  return QStringLiteral("WAV");
    if (ext == QLatin1String("flac")) return QStringLiteral("FLAC");
    if (ext == QLatin1String("ogg"))  return QStringLiteral("OGG");
    if (ext == QLatin1String("m4a"))  return QStringLiteral("M4A");
    if (ext == QLatin1String("aac"))  return QStringLiteral("AAC");
    return QString();
}

} // namespace DecoderFormats
