#include "CrashHandler.h"

#include <csignal>
#include <algorithm>
#include <cstring>
#include <execinfo.h>
#include <fcntl.h>
#include <unistd.h>

#include <QStandardPaths>
#include <QDir>

namespace {

struct FatalSignal {
    int         number;
    const char* name;
};

const FatalSignal kFatalSignals[] = {
    { SIGSEGV, "SIGSEGV" },
    { SIGABRT, "SIGABRT" },
    { SIGFPE,  "SIGFPE"  },
    { SIGBUS,  "SIGBUS"  },
    { SIGILL,  "SIGILL"  },
};

char s_logPath[512] = {0};
char s_track[1024] = {0};

// Async-signal-safe; a failed write just truncates the report
void put(int fd, const char* text)
{
    size_t left = strlen(text);
    while (left > 0) {
        ssize_t n = write(fd, text, left);
        if (n <= 0) return;
        text += n;
        left -= (size_t)n;
    }
}

void onFatalSignal(int sig)
{
    const char* name = "UNKNOWN";
    for (const FatalSignal& s : kFatalSignals) {
        if (s.number == sig) name = s.name;
    }

    int fd = open(s_logPath, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd >= 0) {
        put(fd, "Contexture crash\nsignal: ");
        put(fd, name);
        put(fd, "\ntrack: ");
        put(fd, s_track[0] ? s_track : "(none)");
        put(fd, "\n\nbacktrace:\n");

        void* frames[64];
        backtrace_symbols_fd(frames, backtrace(frames, 64), fd);
        close(fd);
    }

    _exit(128 + sig);
}

} // namespace

void CrashHandler::install()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
                        + QStringLiteral("/Contexture");
    QDir().mkpath(dir);
    const QByteArray path = (dir + QStringLiteral("/crash.log")).toUtf8();
    strncpy(s_logPath, path.constData(), sizeof(s_logPath) - 1);

    // First backtrace() call loads the unwinder, which allocates
    void* warmup[1];
    backtrace(warmup, 1);

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onFatalSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;

    for (const FatalSignal& s : kFatalSignals)
        sigaction(s.number, &sa, nullptr);
}

QString CrashHandler::crashLogPath()
{
    return QString::fromUtf8(s_logPath);
}

void CrashHandler::setCurrentTrack(const QString& filePath)
{
    const QByteArray utf8 = filePath.toUtf8();
    const size_t n = std::min(sizeof(s_track) - 1, (size_t)utf8.size());
    memcpy(s_track, utf8.constData(), n);
    s_track[n] = '\0';
}
