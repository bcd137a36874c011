#pragma once

#include <QMetaType>
#include <QString>
#include <cstdint>
#include <functional>

enum class PlaybackState {
    Stopped,
    Playing,
    Paused,
    Buffering,      // ring-buffer path waiting for its initial fill
    Error,
};

inline QString playbackStateName(PlaybackState state)
{
    switch (state) {
    case PlaybackState::Stopped:   return QStringLiteral("Stopped");
    case PlaybackState::Playing:   return QStringLiteral("Playing");
    case PlaybackState::Paused:    return QStringLiteral("Paused");
    case PlaybackState::Buffering: return QStringLiteral("Buffering");
    case PlaybackState::Error:     return QStringLiteral("Error");
    }
    return QString();
}

struct AudioEvent {
    enum Type {
        StateChanged,
        PositionChanged,
        TrackEnded,
        Error,
        BufferUnderrun,
    };

    Type          type = StateChanged;
    PlaybackState state = PlaybackState::Stopped;   // StateChanged
    uint64_t      position = 0;                     // PositionChanged, in frames
    QString       message;                          // Error

    static AudioEvent stateChanged(PlaybackState s) {
        AudioEvent e; e.type = StateChanged; e.state = s; return e;
    }
    static AudioEvent positionChanged(uint64_t frames) {
        AudioEvent e; e.type = PositionChanged; e.position = frames; return e;
    }
    static AudioEvent trackEnded() {
        AudioEvent e; e.type = TrackEnded; return e;
    }
    static AudioEvent error(const QString& msg) {
        AudioEvent e; e.type = Error; e.message = msg; return e;
    }
    static AudioEvent bufferUnderrun() {
        AudioEvent e; e.type = BufferUnderrun; return e;
    }
};

using AudioEventCallback = std::function<void(const AudioEvent&)>;

Q_DECLARE_METATYPE(PlaybackState)
Q_DECLARE_METATYPE(AudioEvent)
