#pragma once

#include <QObject>
#include <QSettings>
#include <QString>

class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();

    // Standalone store at an explicit INI path (tests, alternate profiles)
    explicit Settings(const QString& iniPath, QObject* parent = nullptr);

    static QString settingsPath();
    QString fileName() const { return m_settings.fileName(); }

    // ── Audio ────────────────────────────────────────────────────────
    // 0..100
    int volume() const;
    void setVolume(int vol);

    int rampDurationMs() const;
    void setRampDurationMs(int ms);

    double ringBufferSeconds() const;
    void setRingBufferSeconds(double seconds);

    // 0 = system default
    uint32_t outputDeviceId() const;
    void setOutputDeviceId(uint32_t deviceId);

    // "none" | "rectangular" | "triangular"
    QString dither() const;
    void setDither(const QString& algorithm);

    // Resample to the nearest supported device rate when the source rate
    // cannot be opened directly
    bool resampleFallback() const;
    void setResampleFallback(bool enabled);

    // "linear" | "high"
    QString resampleQuality() const;
    void setResampleQuality(const QString& quality);

    // Fraction of ring capacity below which the buffer counts as starved
    double underrunThreshold() const;
    void setUnderrunThreshold(double fraction);

    void sync() { m_settings.sync(); }

signals:
    void volumeChanged(int volume);
    void outputDeviceChanged(uint32_t deviceId);
    void audioSettingsChanged();

private:
    explicit Settings(QObject* parent = nullptr);
    QSettings m_settings;
};
