#pragma once

#include <QString>

// Error value shared by the playback core. Carried through bool + lastError()
// on the engine, std::optional results on factories, and Error events.
struct AudioError {
    enum Kind {
        AudioDevice,    // enumeration, stream build, start/stop failures
        AudioFormat,    // invalid or incompatible format parameters
        AudioEngine,    // illegal state transitions
        Decoding,       // opaque decoder failures
        Io,             // file access
    };

    Kind    kind = AudioEngine;
    QString message;

    AudioError() = default;
    AudioError(Kind k, QString msg) : kind(k), message(std::move(msg)) {}

    static QString kindName(Kind kind);

    // e.g. "Audio device error: no output devices found"
    QString toString() const;
};
