#include "Settings.h"
#include <QDebug>
#include <QDir>
#include <QStandardPaths>
#include <algorithm>

// ── Settings INI path ───────────────────────────────────────────────
// ~/.local/share/Contexture/settings.ini
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
             + QStringLiteral("/Contexture"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s;
    return &s;
}

// ── Constructors ────────────────────────────────────────────────────
Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_settings(settingsPath(), QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
}

// ── Audio ───────────────────────────────────────────────────────────
int Settings::volume() const
{
    return std::clamp(m_settings.value(QStringLiteral("audio/volume"), 100).toInt(), 0, 100);
}

void Settings::setVolume(int vol)
{
    vol = std::clamp(vol, 0, 100);
    m_settings.setValue(QStringLiteral("audio/volume"), vol);
    emit volumeChanged(vol);
}

int Settings::rampDurationMs() const
{
    return std::max(0, m_settings.value(QStringLiteral("audio/rampDurationMs"), 20).toInt());
}

void Settings::setRampDurationMs(int ms)
{
    m_settings.setValue(QStringLiteral("audio/rampDurationMs"), std::max(0, ms));
    emit audioSettingsChanged();
}

double Settings::ringBufferSeconds() const
{
    return m_settings.value(QStringLiteral("audio/ringBufferSeconds"), 2.5).toDouble();
}

void Settings::setRingBufferSeconds(double seconds)
{
    m_settings.setValue(QStringLiteral("audio/ringBufferSeconds"), seconds);
    emit audioSettingsChanged();
}

uint32_t Settings::outputDeviceId() const
{
    return m_settings.value(QStringLiteral("audio/outputDeviceId"), 0).toUInt();
}

void Settings::setOutputDeviceId(uint32_t deviceId)
{
    m_settings.setValue(QStringLiteral("audio/outputDeviceId"), deviceId);
    emit outputDeviceChanged(deviceId);
}

QString Settings::dither() const
{
    return m_settings.value(QStringLiteral("audio/dither"),
                            QStringLiteral("triangular")).toString();
}

void Settings::setDither(const QString& algorithm)
{
    m_settings.setValue(QStringLiteral("audio/dither"), algorithm);
    emit audioSettingsChanged();
}

bool Settings::resampleFallback() const
{
    return m_settings.value(QStringLiteral("audio/resampleFallback"), true).toBool();
}

void Settings::setResampleFallback(bool enabled)
{
    m_settings.setValue(QStringLiteral("audio/resampleFallback"), enabled);
    emit audioSettingsChanged();
}

QString Settings::resampleQuality() const
{
    return m_settings.value(QStringLiteral("audio/resampleQuality"),
                            QStringLiteral("high")).toString();
}

void Settings::setResampleQuality(const QString& quality)
{
    m_settings.setValue(QStringLiteral("audio/resampleQuality"), quality);
    emit audioSettingsChanged();
}

double Settings::underrunThreshold() const
{
    return std::clamp(m_settings.value(QStringLiteral("audio/underrunThreshold"), 0.1).toDouble(),
                      0.0, 1.0);
}

void Settings::setUnderrunThreshold(double fraction)
{
    m_settings.setValue(QStringLiteral("audio/underrunThreshold"), std::clamp(fraction, 0.0, 1.0));
    emit audioSettingsChanged();
}
