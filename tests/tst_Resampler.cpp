#include <QtTest/QtTest>
#include <cmath>
#include "core/dsp/Resampler.h"

static std::vector<double> ramp(size_t frames, int channels)
{
    std::vector<double> s(frames * (size_t)channels);
    for (size_t i = 0; i < frames; ++i)
        for (int c = 0; c < channels; ++c)
            s[i * (size_t)channels + (size_t)c] = (double)i / (double)frames * (c == 0 ? 1.0 : -1.0);
    return s;
}

class tst_Resampler : public QObject {
    Q_OBJECT

private slots:

    // ── One-shot linear ─────────────────────────────────────────
    void linear_sameRateIsIdentity()
    {
        auto in = ramp(50, 2);
        QCOMPARE(Resampler::resampleLinear(in, 2, 44100, 44100), in);
    }

    void linear_outputLength()
    {
        auto in = ramp(1000, 2);
        auto up = Resampler::resampleLinear(in, 2, 44100, 48000);
        QCOMPARE(up.size(), size_t(1088 * 2));       // floor(999 * 48000/44100) + 1

        auto down = Resampler::resampleLinear(in, 2, 48000, 24000);
        QCOMPARE(down.size(), size_t(500 * 2));
    }

    void linear_interpolatesBetweenFrames()
    {
        std::vector<double> in = { 0.0, 1.0, 0.5 };
        auto out = Resampler::resampleLinear(in, 1, 100, 200);
        QCOMPARE(out.size(), size_t(5));
        QCOMPARE(out[0], 0.0);
        QCOMPARE(out[1], 0.5);
        QCOMPARE(out[2], 1.0);
        QCOMPARE(out[3], 0.75);
        QCOMPARE(out[4], 0.5);
    }

    void linear_emptyInput()
    {
        QVERIFY(Resampler::resampleLinear({}, 2, 44100, 48000).empty());
    }

    // ── Streaming ───────────────────────────────────────────────
    void streamingLinear_matchesOneShot()
    {
        auto in = ramp(100, 1);
        auto expected = Resampler::resampleLinear(in, 1, 44100, 88200);

        Resampler r(44100, 88200, 1, Resampler::Quality::Linear);
        QVERIFY(r.isValid());
        std::vector<double> out;
        r.process(in.data(), 30, out);
        r.process(in.data() + 30, 30, out);
        r.process(in.data() + 60, 40, out);
        r.flush(out);

        QCOMPARE(out.size(), expected.size());
        for (size_t i = 0; i < out.size(); ++i)
            QVERIFY(std::abs(out[i] - expected[i]) < 1e-12);
    }

    void passthrough_copiesInput()
    {
        Resampler r(48000, 48000, 2);
        QVERIFY(r.isPassthrough());
        auto in = ramp(10, 2);
        std::vector<double> out;
        QCOMPARE(r.process(in.data(), 10, out), size_t(10));
        QCOMPARE(out, in);
        QCOMPARE(r.flush(out), size_t(0));
    }

    void highQuality_producesExpectedLength()
    {
        const size_t frames = 4410;
        std::vector<double> in(frames * 2);
        for (size_t i = 0; i < frames; ++i) {
            double v = 0.5 * std::sin(2.0 * M_PI * 440.0 * (double)i / 44100.0);
            in[i * 2] = v;
            in[i * 2 + 1] = v;
        }

        Resampler r(44100, 48000, 2, Resampler::Quality::High);
        QVERIFY2(r.isValid(), qPrintable(r.lastError()));
        std::vector<double> out;
        r.process(in.data(), frames, out);
        r.flush(out);

        const double produced = (double)(out.size() / 2);
        QVERIFY(std::abs(produced - 4800.0) <= 4.0);

        double peak = 0.0;
        for (double v : out) peak = std::max(peak, std::abs(v));
        QVERIFY(peak > 0.4 && peak < 0.6);
    }

    void invalidParameters()
    {
        Resampler r(0, 48000, 2);
        QVERIFY(!r.isValid());
        QVERIFY(!r.lastError().isEmpty());
    }

    void qualityNames()
    {
        QCOMPARE(Resampler::qualityFromString(QStringLiteral("linear")), Resampler::Quality::Linear);
        QCOMPARE(Resampler::qualityFromString(QStringLiteral("High")), Resampler::Quality::High);
        QCOMPARE(Resampler::qualityFromString(QString()), Resampler::Quality::High);
    }
};

QTEST_MAIN(tst_Resampler)
#include "tst_Resampler.moc"
