#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFile>
#include <QTimer>
#include <csignal>
#include <cstdio>
#include <memory>

#include "core/CrashHandler.h"
#include "core/Settings.h"
#include "core/audio/AudioEngine.h"

// ── Ctrl-C: stop playback through the event loop ────────────────────
static volatile std::sig_atomic_t s_interrupted = 0;

static void interruptHandler(int)
{
    s_interrupted = 1;
}

static void listDevices(const AudioEngine& engine)
{
    const auto devices = engine.availableDevices();
    if (devices.empty()) {
        fprintf(stdout, "No output devices found\n");
        return;
    }
    for (const AudioDevice& d : devices) {
        fprintf(stdout, "%3u  %s%s\n", d.deviceId, d.name.c_str(),
                d.isDefault ? "  (default)" : "");
        for (const SupportedConfigRange& r : d.configRanges) {
            fprintf(stdout, "       %u-%u Hz, %u ch, %s\n", r.minSampleRate, r.maxSampleRate,
                    (unsigned)r.channels,
                    SampleFormats::name(r.sampleFormat).toUtf8().constData());
        }
    }
}

int main(int argc, char* argv[])
{
    CrashHandler::install();

    QCoreApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("Contexture"));
    app.setApplicationName(QStringLiteral("contexture-play"));
    app.setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Plays an audio file on the system output."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("Audio file to play."));

    QCommandLineOption volumeOption({QStringLiteral("v"), QStringLiteral("volume")},
        QStringLiteral("Playback volume, 0-100."), QStringLiteral("percent"));
    QCommandLineOption deviceOption({QStringLiteral("d"), QStringLiteral("device")},
        QStringLiteral("Output device id (see --list-devices)."), QStringLiteral("id"));
    QCommandLineOption staticOption(QStringLiteral("static"),
        QStringLiteral("Decode the whole file before playing instead of streaming."));
    QCommandLineOption loopOption(QStringLiteral("loop"),
        QStringLiteral("Restart from the beginning when the track ends."));
    QCommandLineOption listOption({QStringLiteral("l"), QStringLiteral("list-devices")},
        QStringLiteral("List output devices and exit."));
    QCommandLineOption settingsOption(QStringLiteral("settings"),
        QStringLiteral("Read settings from this INI file."), QStringLiteral("path"));
    parser.addOptions({volumeOption, deviceOption, staticOption, loopOption, listOption,
                       settingsOption});
    parser.process(app);

    {
        QString crashLog = CrashHandler::crashLogPath();
        if (QFile::exists(crashLog)) {
            qWarning() << "[STARTUP] Previous crash detected:" << crashLog;
            QString prevPath = crashLog;
            prevPath.replace(QStringLiteral(".log"), QStringLiteral("_prev.log"));
            QFile::remove(prevPath);
            QFile::rename(crashLog, prevPath);
        }
    }

    AudioEngine engine;

    if (parser.isSet(listOption)) {
        listDevices(engine);
        return 0;
    }

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(1);
    }

    std::unique_ptr<Settings> customSettings;
    Settings* settings = Settings::instance();
    if (parser.isSet(settingsOption)) {
        customSettings = std::make_unique<Settings>(parser.value(settingsOption));
        settings = customSettings.get();
    }
    engine.applySettings(*settings);

    if (parser.isSet(volumeOption)) {
        bool ok = false;
        int vol = parser.value(volumeOption).toInt(&ok);
        if (!ok || vol < 0 || vol > 100) {
            fprintf(stderr, "Invalid volume: %s\n", qPrintable(parser.value(volumeOption)));
            return 1;
        }
        engine.setVolume(vol / 100.0);
    }
    if (parser.isSet(deviceOption)) {
        bool ok = false;
        uint id = parser.value(deviceOption).toUInt(&ok);
        if (!ok) {
            fprintf(stderr, "Invalid device id: %s\n", qPrintable(parser.value(deviceOption)));
            return 1;
        }
        engine.setOutputDevice(id);
    }

    const bool loop = parser.isSet(loopOption);
    int exitCode = 0;

    QObject::connect(&engine, &AudioEngine::trackEnded, &app, [&]() {
        if (loop && engine.play()) {
            qDebug() << "[Player] Looping";
            return;
        }
        app.quit();
    });
    QObject::connect(&engine, &AudioEngine::errorOccurred, &app, [&](const QString& message) {
        fprintf(stderr, "Error: %s\n", qPrintable(message));
        // Recovery may have brought the engine back to Stopped; either way we are done
        exitCode = 2;
        QTimer::singleShot(0, &app, &QCoreApplication::quit);
    });
    QObject::connect(&engine, &AudioEngine::bufferUnderrun, &app, []() {
        qWarning() << "[Player] Buffer underrun";
    });
    QObject::connect(&engine, &AudioEngine::stateChanged, &app, [](PlaybackState state) {
        qDebug() << "[Player] State:" << playbackStateName(state);
    });

    const QString filePath = args.first();
    CrashHandler::setCurrentTrack(filePath);
    const bool loaded = parser.isSet(staticOption) ? engine.loadFile(filePath)
                                                   : engine.loadFileWithRingBuffer(filePath);
    if (!loaded || !engine.play()) {
        fprintf(stderr, "Cannot play %s: %s\n", qPrintable(filePath),
                qPrintable(engine.lastError().toString()));
        return 2;
    }

    if (auto fmt = engine.format())
        fprintf(stdout, "Playing %s (%s)\n", qPrintable(filePath), qPrintable(fmt->toString()));

    std::signal(SIGINT, interruptHandler);
    std::signal(SIGTERM, interruptHandler);
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, &app, [&]() {
        if (s_interrupted) {
            qDebug() << "[Player] Interrupted";
            app.quit();
        }
    });
    interruptPoll.start(100);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        if (engine.state() != PlaybackState::Error)
            engine.stop();
        settings->sync();
    });

    int ret = app.exec();
    return exitCode != 0 ? exitCode : ret;
}
