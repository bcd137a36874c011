#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>

#include "AudioBuffer.h"
#include "AudioError.h"
#include "AudioFormat.h"

// Source of canonical audio. AudioDecoder implements it with FFmpeg; tests
// substitute their own.
class IDecoder {
public:
    virtual ~IDecoder() = default;

    virtual bool open(const QString& filePath) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Valid after a successful open()
    virtual AudioFormat format() const = 0;

    // Total frames, when the container knows it
    virtual std::optional<uint64_t> duration() const = 0;

    virtual bool seek(uint64_t frame) = 0;

    // Next chunk of audio; nullopt at end of stream or on a decode failure
    // (lastError() tells them apart)
    virtual std::optional<DecodedPacket> decodeNext() = 0;

    // Rest of the stream in one buffer
    virtual std::optional<AudioBuffer> decodeAll();

    virtual QString codecName() const { return QString(); }

    // Kind Decoding or Io; empty message when the last call succeeded
    virtual AudioError lastError() const = 0;
};

namespace DecoderFormats {

// Lower-case, without the dot
QStringList supportedExtensions();
bool isFormatSupported(const QString& path);

// e.g. "FLAC" for track.flac; empty when unsupported
QString formatNameFromExtension(const QString& path);

} // namespace DecoderFormats
