#include "Resampler.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

Resampler::Resampler(uint32_t sourceRate, uint32_t targetRate, int channels, Quality quality)
    : m_sourceRate(sourceRate)
    , m_targetRate(targetRate)
    , m_channels(channels)
    , m_quality(quality)
    , m_prevFrame(static_cast<size_t>(std::max(channels, 0)), 0.0)
{
    if (sourceRate == 0 || targetRate == 0 || channels <= 0) {
        m_valid = false;
        m_error = QStringLiteral("Invalid resampler parameters: %1 -> %2 Hz, %3 ch")
                      .arg(sourceRate).arg(targetRate).arg(channels);
        return;
    }

    if (m_quality == Quality::High && !isPassthrough())
        m_valid = createSoxr();

    qDebug() << "[Resampler]" << sourceRate << "->" << targetRate << "Hz"
             << channels << "ch" << (m_quality == Quality::High ? "soxr HQ" : "linear");
}

Resampler::~Resampler()
{
    destroySoxr();
}

bool Resampler::createSoxr()
{
    soxr_error_t err = nullptr;
    soxr_io_spec_t ioSpec = soxr_io_spec(SOXR_FLOAT64_I, SOXR_FLOAT64_I);
    soxr_quality_spec_t qSpec = soxr_quality_spec(SOXR_HQ, 0);

    m_soxr = soxr_create((double)m_sourceRate, (double)m_targetRate,
                         (unsigned)m_channels, &err, &ioSpec, &qSpec, nullptr);
    if (err || !m_soxr) {
        m_error = QStringLiteral("soxr_create failed: %1")
                      .arg(QString::fromUtf8(err ? err : "unknown"));
        qWarning() << "[Resampler]" << m_error;
        m_soxr = nullptr;
        return false;
    }
    return true;
}

void Resampler::destroySoxr()
{
    soxr_t old = m_soxr;
    m_soxr = nullptr;
    if (old) soxr_delete(old);
}

void Resampler::reset()
{
    m_havePrev = false;
    m_position = 0.0;
    std::fill(m_prevFrame.begin(), m_prevFrame.end(), 0.0);
    if (m_soxr) soxr_clear(m_soxr);
}

size_t Resampler::process(const double* input, size_t frames, std::vector<double>& output)
{
    if (!m_valid || frames == 0) return 0;

    const size_t ch = static_cast<size_t>(m_channels);
    if (isPassthrough()) {
        output.insert(output.end(), input, input + frames * ch);
        return frames;
    }

    if (m_quality == Quality::Linear)
        return processLinear(input, frames, output);

    // soxr: size the output generously; it may hold samples back
    const size_t capacity = (size_t)std::ceil(frames * ratio()) + 64;
    const size_t start = output.size();
    output.resize(start + capacity * ch);

    size_t inDone = 0, outDone = 0;
    soxr_error_t err = soxr_process(m_soxr, input, frames, &inDone,
                                    output.data() + start, capacity, &outDone);
    output.resize(start + outDone * ch);
    if (err) {
        m_error = QString::fromUtf8(err);
        qWarning() << "[Resampler] soxr_process:" << m_error;
        return 0;
    }
    return outDone;
}

size_t Resampler::flush(std::vector<double>& output)
{
    if (!m_valid || isPassthrough()) return 0;

    const size_t ch = static_cast<size_t>(m_channels);

    if (m_quality == Quality::Linear) {
        // Last input frame lands exactly on an output position
        if (m_havePrev && m_position < 1e-9) {
            output.insert(output.end(), m_prevFrame.begin(), m_prevFrame.end());
            m_havePrev = false;
            return 1;
        }
        return 0;
    }

    size_t total = 0;
    for (;;) {
        const size_t chunk = 1024;
        const size_t start = output.size();
        output.resize(start + chunk * ch);
        size_t outDone = 0;
        soxr_error_t err = soxr_process(m_soxr, nullptr, 0, nullptr,
                                        output.data() + start, chunk, &outDone);
        output.resize(start + outDone * ch);
        total += outDone;
        if (err) {
            m_error = QString::fromUtf8(err);
            qWarning() << "[Resampler] soxr flush:" << m_error;
            break;
        }
        if (outDone < chunk) break;
    }
    return total;
}

// ── linear ──────────────────────────────────────────────────────────
// The virtual input is [prev frame] + input. m_position is measured from
// its first frame and always lies in [0, 1) between calls.
size_t Resampler::processLinear(const double* input, size_t frames, std::vector<double>& output)
{
    const size_t ch = static_cast<size_t>(m_channels);
    const size_t offset = m_havePrev ? 1 : 0;
    const size_t n = frames + offset;
    const double step = 1.0 / ratio();

    auto frameAt = [&](size_t idx) -> const double* {
        if (m_havePrev && idx == 0) return m_prevFrame.data();
        return input + (idx - offset) * ch;
    };

    size_t produced = 0;
    while (m_position < (double)(n - 1)) {
        const size_t idx = static_cast<size_t>(m_position);
        const double frac = m_position - (double)idx;
        const double* a = frameAt(idx);
        const double* b = frameAt(idx + 1);
        for (size_t c = 0; c < ch; ++c)
            output.push_back(a[c] + (b[c] - a[c]) * frac);
        ++produced;
        m_position += step;
    }

    m_position -= (double)(n - 1);
    const double* last = frameAt(n - 1);
    std::copy(last, last + ch, m_prevFrame.begin());
    m_havePrev = true;
    return produced;
}

std::vector<double> Resampler::resampleLinear(const std::vector<double>& interleaved,
                                              int channels,
                                              uint32_t sourceRate,
                                              uint32_t targetRate)
{
    if (channels <= 0 || sourceRate == 0 || targetRate == 0 || interleaved.empty())
        return {};
    if (sourceRate == targetRate)
        return interleaved;

    const size_t ch = static_cast<size_t>(channels);
    const size_t inFrames = interleaved.size() / ch;
    if (inFrames == 0) return {};

    const double r = (double)targetRate / (double)sourceRate;
    const size_t outFrames = static_cast<size_t>(std::floor((double)(inFrames - 1) * r)) + 1;

    std::vector<double> out(outFrames * ch);
    for (size_t i = 0; i < outFrames; ++i) {
        const double srcPos = (double)i / r;
        const size_t idx = std::min(static_cast<size_t>(srcPos), inFrames - 1);
        const size_t next = std::min(idx + 1, inFrames - 1);
        const double frac = srcPos - (double)idx;
        for (size_t c = 0; c < ch; ++c) {
            const double a = interleaved[idx * ch + c];
            const double b = interleaved[next * ch + c];
            out[i * ch + c] = a + (b - a) * frac;
        }
    }
    return out;
}

Resampler::Quality Resampler::qualityFromString(const QString& name)
{
    return name.trimmed().compare(QLatin1String("linear"), Qt::CaseInsensitive) == 0
        ? Quality::Linear : Quality::High;
}
