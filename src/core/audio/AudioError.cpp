#include "AudioError.h"

QString AudioError::kindName(Kind kind)
{
    switch (kind) {
    case AudioDevice: return QStringLiteral("Audio device error");
    case AudioFormat: return QStringLiteral("Audio format error");
    case AudioEngine: return QStringLiteral("Audio engine error");
    case Decoding:    return QStringLiteral("Audio decoding error");
    case Io:          return QStringLiteral("File I/O error");
    }
    return QStringLiteral("Error");
}

QString AudioError::toString() const
{
    return kindName(kind) + QStringLiteral(": ") + message;
}
