#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "core/Settings.h"
#include "core/audio/AudioEngine.h"
#include "FakeAudio.h"

class tst_Settings : public QObject {
    Q_OBJECT

private slots:

    void defaults()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        Settings s(dir.filePath(QStringLiteral("settings.ini")));

        QCOMPARE(s.volume(), 100);
        QCOMPARE(s.rampDurationMs(), 20);
        QCOMPARE(s.ringBufferSeconds(), 2.5);
        QCOMPARE(s.outputDeviceId(), 0u);
        QCOMPARE(s.dither(), QStringLiteral("triangular"));
        QVERIFY(s.resampleFallback());
        QCOMPARE(s.resampleQuality(), QStringLiteral("high"));
        QCOMPARE(s.underrunThreshold(), 0.1);
    }

    void values_persistAcrossInstances()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("settings.ini"));
        {
            Settings s(path);
            s.setVolume(35);
            s.setOutputDeviceId(3);
            s.setDither(QStringLiteral("none"));
            s.setResampleQuality(QStringLiteral("linear"));
            s.setRingBufferSeconds(1.5);
            s.sync();
        }
        Settings again(path);
        QCOMPARE(again.volume(), 35);
        QCOMPARE(again.outputDeviceId(), 3u);
        QCOMPARE(again.dither(), QStringLiteral("none"));
        QCOMPARE(again.resampleQuality(), QStringLiteral("linear"));
        QCOMPARE(again.ringBufferSeconds(), 1.5);
        QVERIFY(QFile::exists(path));
    }

    void setters_clamp()
    {
        QTemporaryDir dir;
        Settings s(dir.filePath(QStringLiteral("settings.ini")));
        s.setVolume(250);
        QCOMPARE(s.volume(), 100);
        s.setVolume(-5);
        QCOMPARE(s.volume(), 0);
        s.setUnderrunThreshold(3.0);
        QCOMPARE(s.underrunThreshold(), 1.0);
        s.setRampDurationMs(-10);
        QCOMPARE(s.rampDurationMs(), 0);
    }

    void signals_fire()
    {
        QTemporaryDir dir;
        Settings s(dir.filePath(QStringLiteral("settings.ini")));
        QSignalSpy volumeSpy(&s, &Settings::volumeChanged);
        QSignalSpy deviceSpy(&s, &Settings::outputDeviceChanged);
        QSignalSpy audioSpy(&s, &Settings::audioSettingsChanged);

        s.setVolume(40);
        s.setOutputDeviceId(2);
        s.setDither(QStringLiteral("rectangular"));

        QCOMPARE(volumeSpy.count(), 1);
        QCOMPARE(volumeSpy.at(0).at(0).toInt(), 40);
        QCOMPARE(deviceSpy.count(), 1);
        QCOMPARE(audioSpy.count(), 1);
    }

    // ── Applied to the engine ───────────────────────────────────
    void applySettings_configuresEngine()
    {
        QTemporaryDir dir;
        Settings s(dir.filePath(QStringLiteral("settings.ini")));
        s.setVolume(50);
        s.setOutputDeviceId(7);

        AudioEngine engine(std::make_unique<FakeAudioOutput>(),
                           []() -> std::unique_ptr<IDecoder> { return nullptr; });
        engine.applySettings(s);
        QCOMPARE(engine.volume(), 0.5);
        QCOMPARE(engine.outputDevice(), 7u);
        QVERIFY(!engine.isMuted());
    }
};

QTEST_MAIN(tst_Settings)
#include "tst_Settings.moc"
