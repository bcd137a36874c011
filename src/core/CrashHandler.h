#pragma once

#include <QString>

// Writes a backtrace to crash.log under the app data directory when the
// process dies on a fatal signal. The report names the track that was
// loaded at the time.
class CrashHandler {
public:
    static void install();
    static QString crashLogPath();

    // Remembered for the next report; truncated to a fixed size
    static void setCurrentTrack(const QString& filePath);
};
