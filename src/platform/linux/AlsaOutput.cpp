#include "AlsaOutput.h"

#include <QDebug>
#include <alsa/asoundlib.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

namespace {

constexpr SampleFormat kProbeFormats[] = {
    SampleFormat::F32, SampleFormat::I32, SampleFormat::I24,
    SampleFormat::I16, SampleFormat::U8,
};

constexpr int kMaxProbedChannels = 8;

snd_pcm_format_t toAlsaFormat(SampleFormat format)
{
    switch (format) {
    case SampleFormat::U8:  return SND_PCM_FORMAT_U8;
    case SampleFormat::I8:  return SND_PCM_FORMAT_S8;
    case SampleFormat::U16: return SND_PCM_FORMAT_U16_LE;
    case SampleFormat::I16: return SND_PCM_FORMAT_S16_LE;
    case SampleFormat::I24: return SND_PCM_FORMAT_S24_3LE;
    case SampleFormat::I32: return SND_PCM_FORMAT_S32_LE;
    case SampleFormat::F32: return SND_PCM_FORMAT_FLOAT_LE;
    case SampleFormat::F64: return SND_PCM_FORMAT_FLOAT64_LE;
    }
    return SND_PCM_FORMAT_UNKNOWN;
}

// Opens `pcmName` just long enough to read its hardware capabilities
std::vector<SupportedConfigRange> probeConfigRanges(const std::string& pcmName)
{
    std::vector<SupportedConfigRange> ranges;

    snd_pcm_t* handle = nullptr;
    if (snd_pcm_open(&handle, pcmName.c_str(), SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK) < 0)
        return ranges;

    snd_pcm_hw_params_t* hw;
    snd_pcm_hw_params_alloca(&hw);
    if (snd_pcm_hw_params_any(handle, hw) < 0) {
        snd_pcm_close(handle);
        return ranges;
    }

    unsigned int rateMin = 0, rateMax = 0, chMin = 0, chMax = 0;
    snd_pcm_hw_params_get_rate_min(hw, &rateMin, nullptr);
    snd_pcm_hw_params_get_rate_max(hw, &rateMax, nullptr);
    snd_pcm_hw_params_get_channels_min(hw, &chMin);
    snd_pcm_hw_params_get_channels_max(hw, &chMax);

    // Plug devices report huge upper bounds
    rateMax = std::min<unsigned int>(rateMax, AudioFormat::kMaxSampleRate);
    chMax = std::min<unsigned int>(chMax, kMaxProbedChannels);

    for (SampleFormat fmt : kProbeFormats) {
        if (snd_pcm_hw_params_test_format(handle, hw, toAlsaFormat(fmt)) != 0)
            continue;
        for (unsigned int ch = std::max(1u, chMin); ch <= chMax; ++ch) {
            SupportedConfigRange r;
            r.minSampleRate = rateMin;
            r.maxSampleRate = rateMax;
            r.channels = (int)ch;
            r.sampleFormat = fmt;
            ranges.push_back(r);
        }
    }

    snd_pcm_close(handle);
    return ranges;
}

} // namespace

std::unique_ptr<IAudioOutput> createPlatformAudioOutput()
{
    return std::make_unique<AlsaOutput>();
}

struct AlsaOutput::Impl {
    snd_pcm_t*         pcm = nullptr;
    AudioFormat        format;
    std::string        pcmName;
    std::string        name;
    snd_pcm_uframes_t  periodFrames = 1024;
    uint32_t           requestedPeriod = 1024;
    QString            error;

    std::thread        renderThread;
    std::atomic<bool>  running{false};

    std::mutex         cbMutex;
    RenderCallback     renderCb;
    ErrorCallback      errorCb;

    std::vector<uint8_t> periodBuf;

    void renderLoop();
    void reportError(const QString& message);
};

void AlsaOutput::Impl::reportError(const QString& message)
{
    std::lock_guard<std::mutex> lock(cbMutex);
    if (errorCb) errorCb(message);
}

void AlsaOutput::Impl::renderLoop()
{
    const size_t frameBytes = format.frameSize();

    while (running.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(cbMutex, std::try_to_lock);
            if (lock.owns_lock() && renderCb)
                renderCb(periodBuf.data(), (int)periodFrames);
            else
                std::memset(periodBuf.data(), 0, periodBuf.size());
        }

        const uint8_t* p = periodBuf.data();
        snd_pcm_uframes_t left = periodFrames;
        while (left > 0 && running.load(std::memory_order_acquire)) {
            snd_pcm_sframes_t n = snd_pcm_writei(pcm, p, left);
            if (n == -EAGAIN) {
                snd_pcm_wait(pcm, 100);
                continue;
            }
            if (n < 0) {
                // -EPIPE (underrun) and -ESTRPIPE (suspend) are recoverable
                if (snd_pcm_recover(pcm, (int)n, 1) < 0) {
                    running.store(false, std::memory_order_release);
                    reportError(QStringLiteral("ALSA write failed: %1")
                                    .arg(QString::fromUtf8(snd_strerror((int)n))));
                    return;
                }
                continue;
            }
            p += (size_t)n * frameBytes;
            left -= (snd_pcm_uframes_t)n;
        }
    }
}

AlsaOutput::AlsaOutput()
    : m_impl(std::make_unique<Impl>())
{
}

AlsaOutput::~AlsaOutput()
{
    close();
}

bool AlsaOutput::open(const AudioFormat& format, uint32_t deviceId)
{
    close();
    auto& d = *m_impl;
    d.error.clear();

    std::string pcmName = "default";
    std::string displayName = "Default";
    if (deviceId != 0) {
        auto devices = enumerateDevicesStatic();
        auto it = std::find_if(devices.begin(), devices.end(),
                               [deviceId](const AudioDevice& dev) { return dev.deviceId == deviceId; });
        if (it == devices.end()) {
            d.error = QStringLiteral("Device %1 not found").arg(deviceId);
            qWarning() << "[ALSA]" << d.error;
            return false;
        }
        pcmName = it->systemName;
        displayName = it->name;
    }

    auto fail = [&d](const QString& what, int err) {
        d.error = QStringLiteral("%1: %2").arg(what, QString::fromUtf8(snd_strerror(err)));
        qWarning() << "[ALSA]" << d.error;
        if (d.pcm) {
            snd_pcm_close(d.pcm);
            d.pcm = nullptr;
        }
        return false;
    };

    int err = snd_pcm_open(&d.pcm, pcmName.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        d.pcm = nullptr;
        return fail(QStringLiteral("Cannot open %1").arg(QString::fromStdString(pcmName)), err);
    }

    snd_pcm_hw_params_t* hw;
    snd_pcm_hw_params_alloca(&hw);
    snd_pcm_hw_params_any(d.pcm, hw);

    if ((err = snd_pcm_hw_params_set_access(d.pcm, hw, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0)
        return fail(QStringLiteral("Cannot set access"), err);
    if ((err = snd_pcm_hw_params_set_format(d.pcm, hw, toAlsaFormat(format.sampleFormat))) < 0)
        return fail(QStringLiteral("Cannot set format %1").arg(SampleFormats::name(format.sampleFormat)), err);
    if ((err = snd_pcm_hw_params_set_channels(d.pcm, hw, (unsigned)format.channels)) < 0)
        return fail(QStringLiteral("Cannot set %1 channels").arg(format.channels), err);
    if ((err = snd_pcm_hw_params_set_rate(d.pcm, hw, format.sampleRate, 0)) < 0)
        return fail(QStringLiteral("Cannot set rate %1").arg(format.sampleRate), err);

    snd_pcm_uframes_t period = d.requestedPeriod;
    if ((err = snd_pcm_hw_params_set_period_size_near(d.pcm, hw, &period, nullptr)) < 0)
        return fail(QStringLiteral("Cannot set period size"), err);
    snd_pcm_uframes_t bufferFrames = period * 4;
    if ((err = snd_pcm_hw_params_set_buffer_size_near(d.pcm, hw, &bufferFrames)) < 0)
        return fail(QStringLiteral("Cannot set buffer size"), err);
    if ((err = snd_pcm_hw_params(d.pcm, hw)) < 0)
        return fail(QStringLiteral("Cannot apply hardware parameters"), err);

    snd_pcm_hw_params_get_period_size(hw, &d.periodFrames, nullptr);
    snd_pcm_hw_params_get_buffer_size(hw, &bufferFrames);

    if ((err = snd_pcm_prepare(d.pcm)) < 0)
        return fail(QStringLiteral("Cannot prepare device"), err);

    d.format = format;
    d.pcmName = pcmName;
    d.name = displayName;
    d.periodBuf.assign(d.periodFrames * format.frameSize(), 0);

    qDebug() << "[ALSA] Opened" << QString::fromStdString(pcmName) << format.toString()
             << "period" << (qulonglong)d.periodFrames << "buffer" << (qulonglong)bufferFrames;
    return true;
}

bool AlsaOutput::start()
{
    auto& d = *m_impl;
    if (!d.pcm) {
        d.error = QStringLiteral("Stream not open");
        return false;
    }
    if (d.running.load(std::memory_order_acquire))
        return true;

    snd_pcm_state_t st = snd_pcm_state(d.pcm);
    if (st != SND_PCM_STATE_PREPARED && st != SND_PCM_STATE_RUNNING) {
        int err = snd_pcm_prepare(d.pcm);
        if (err < 0) {
            d.error = QStringLiteral("Cannot prepare device: %1")
                          .arg(QString::fromUtf8(snd_strerror(err)));
            qWarning() << "[ALSA]" << d.error;
            return false;
        }
    }

    d.running.store(true, std::memory_order_release);
    d.renderThread = std::thread([impl = m_impl.get()]() { impl->renderLoop(); });
    return true;
}

void AlsaOutput::stop()
{
    auto& d = *m_impl;
    d.running.store(false, std::memory_order_release);
    if (d.renderThread.joinable())
        d.renderThread.join();
    if (d.pcm) {
        snd_pcm_drop(d.pcm);
        snd_pcm_prepare(d.pcm);
    }
}

void AlsaOutput::close()
{
    stop();
    auto& d = *m_impl;
    if (d.pcm) {
        snd_pcm_close(d.pcm);
        d.pcm = nullptr;
        qDebug() << "[ALSA] Closed" << QString::fromStdString(d.pcmName);
    }
}

bool AlsaOutput::isOpen() const
{
    return m_impl->pcm != nullptr;
}

bool AlsaOutput::isRunning() const
{
    return m_impl->running.load(std::memory_order_acquire);
}

void AlsaOutput::setRenderCallback(RenderCallback cb)
{
    std::lock_guard<std::mutex> lock(m_impl->cbMutex);
    m_impl->renderCb = std::move(cb);
}

void AlsaOutput::setErrorCallback(ErrorCallback cb)
{
    std::lock_guard<std::mutex> lock(m_impl->cbMutex);
    m_impl->errorCb = std::move(cb);
}

void AlsaOutput::setBufferSize(uint32_t frames)
{
    m_impl->requestedPeriod = std::max<uint32_t>(frames, 64);
}

AudioFormat AlsaOutput::streamFormat() const
{
    return m_impl->format;
}

std::string AlsaOutput::deviceName() const
{
    return m_impl->name;
}

QString AlsaOutput::errorString() const
{
    return m_impl->error;
}

std::vector<AudioDevice> AlsaOutput::enumerateDevices() const
{
    return enumerateDevicesStatic();
}

std::vector<AudioDevice> AlsaOutput::enumerateDevicesStatic()
{
    std::vector<AudioDevice> devices;

    AudioDevice def;
    def.deviceId = 0;
    def.name = "Default";
    def.systemName = "default";
    def.isDefault = true;
    def.configRanges = probeConfigRanges(def.systemName);
    devices.push_back(std::move(def));

    int card = -1;
    while (snd_card_next(&card) == 0 && card >= 0) {
        char* cardName = nullptr;
        if (snd_card_get_name(card, &cardName) < 0)
            continue;

        AudioDevice dev;
        // Id 0 is the default device
        dev.deviceId = (uint32_t)card + 1;
        dev.name = cardName;
        dev.systemName = "plughw:" + std::to_string(card) + ",0";
        dev.configRanges = probeConfigRanges("hw:" + std::to_string(card) + ",0");
        free(cardName);

        if (!dev.configRanges.empty())
            devices.push_back(std::move(dev));
    }

    return devices;
}
