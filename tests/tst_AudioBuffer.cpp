#include <QtTest/QtTest>
#include "core/audio/AudioBuffer.h"
#include "FakeAudio.h"

namespace {

// Header claims a length far beyond the actual data (a 0xFFFFFFFF WAV size
// or a corrupt container)
class BogusLengthDecoder : public FakeDecoder {
public:
    using FakeDecoder::FakeDecoder;
    std::optional<uint64_t> duration() const override { return uint64_t(1) << 62; }
};

} // namespace

class tst_AudioBuffer : public QObject {
    Q_OBJECT

private slots:

    void empty_buffer()
    {
        AudioBuffer b;
        QVERIFY(b.isEmpty());
        QCOMPARE(b.frames(), size_t(0));
        QCOMPARE(b.durationSeconds(), 0.0);
        QVERIFY(b.samples().empty());
    }

    void frames_and_duration()
    {
        AudioBuffer b(std::vector<double>(48000 * 2, 0.1), AudioFormat(48000, 2, SampleFormat::F32));
        QCOMPARE(b.sampleCount(), size_t(96000));
        QCOMPARE(b.frames(), size_t(48000));
        QCOMPARE(b.durationSeconds(), 1.0);
    }

    void copies_shareStorage()
    {
        AudioBuffer a(std::vector<double>{0.1, 0.2}, AudioFormat(44100, 1, SampleFormat::F32));
        AudioBuffer b = a;
        QCOMPARE(a.data(), b.data());
    }

    void channelData_deinterleaves()
    {
        AudioBuffer b(std::vector<double>{1, -1, 2, -2, 3, -3}, AudioFormat(44100, 2, SampleFormat::F32));
        QCOMPARE(b.channelData(0), (std::vector<double>{1, 2, 3}));
        QCOMPARE(b.channelData(1), (std::vector<double>{-1, -2, -3}));
        QVERIFY(b.channelData(2).empty());
        QVERIFY(b.channelData(-1).empty());
    }

    void slice_clipsToEnd()
    {
        AudioBuffer b(makeIndexedSignal(10, 2), AudioFormat(44100, 2, SampleFormat::F32));
        AudioBuffer s = b.slice(8, 5);
        QCOMPARE(s.frames(), size_t(2));
        QCOMPARE(s.samples()[0], 0.008);
        QVERIFY(b.slice(20, 3).isEmpty());
        QCOMPARE(s.format(), b.format());
    }

    void conversions()
    {
        AudioBuffer b(std::vector<double>{1.0, -1.0, 0.5, 2.0}, AudioFormat(44100, 2, SampleFormat::F32));
        auto i16 = b.toI16();
        QCOMPARE(i16[0], int16_t(32767));
        QCOMPARE(i16[1], int16_t(-32767));
        QCOMPARE(i16[3], int16_t(32767));

        auto i32 = b.toI32();
        QCOMPARE(i32[0], int32_t(2147483647));

        auto f32 = b.toF32();
        QCOMPARE(f32[2], 0.5f);
    }

    // ── decodeAll over the decoder interface ────────────────────
    void decodeAll_collectsPackets()
    {
        AudioFormat fmt(44100, 2, SampleFormat::I16);
        FakeDecoder dec(fmt, makeIndexedSignal(10000, 2), 1024);
        QVERIFY(!dec.decodeAll().has_value());          // not open

        QVERIFY(dec.open(QStringLiteral("x.wav")));
        auto all = dec.decodeAll();
        QVERIFY(all.has_value());
        QCOMPARE(all->frames(), size_t(10000));
        QCOMPARE(all->format(), fmt);
        QCOMPARE(all->samples()[2 * 1500], 0.5);
    }

    void decodeAll_ignoresImplausibleHeaderLength()
    {
        AudioFormat fmt(44100, 2, SampleFormat::I16);
        BogusLengthDecoder dec(fmt, makeIndexedSignal(3000, 2), 512);
        QVERIFY(dec.open(QStringLiteral("x.wav")));

        auto all = dec.decodeAll();
        QVERIFY(all.has_value());
        QCOMPARE(all->frames(), size_t(3000));
        QCOMPARE(all->samples()[2 * 2999], 0.999);
    }
};

QTEST_MAIN(tst_AudioBuffer)
#include "tst_AudioBuffer.moc"
