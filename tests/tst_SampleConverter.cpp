#include <QtTest/QtTest>
#include <cstdlib>
#include <cstring>
#include "core/dsp/SampleConverter.h"

class tst_SampleConverter : public QObject {
    Q_OBJECT

private slots:

    // ── I16 ─────────────────────────────────────────────────────
    void i16_roundTripWithinOneLsb()
    {
        const int16_t values[] = { -32768, -32767, -12345, -1, 0, 1, 2, 1000, 16384, 32766, 32767 };
        for (int16_t v : values) {
            int16_t back = SampleConverter::canonicalToI16(SampleConverter::i16ToCanonical(v));
            QVERIFY2(std::abs((int)back - (int)v) <= 1,
                     qPrintable(QStringLiteral("%1 -> %2").arg(v).arg(back)));
        }
    }

    void i16_fullScale()
    {
        QCOMPARE(SampleConverter::i16ToCanonical(32767), 1.0);
        QCOMPARE(SampleConverter::i16ToCanonical(0), 0.0);
        QCOMPARE(SampleConverter::canonicalToI16(1.0), int16_t(32767));
        QCOMPARE(SampleConverter::canonicalToI16(-1.0), int16_t(-32767));
    }

    void i16_clampsOutOfRange()
    {
        QCOMPARE(SampleConverter::canonicalToI16(1.7), int16_t(32767));
        QCOMPARE(SampleConverter::canonicalToI16(-4.0), int16_t(-32767));
    }

    void i16_bytesAreLittleEndian()
    {
        std::vector<uint8_t> bytes = SampleConverter::fromCanonical(std::vector<double>{1.0}, SampleFormat::I16);
        QCOMPARE(bytes.size(), size_t(2));
        QCOMPARE(bytes[0], uint8_t(0xFF));
        QCOMPARE(bytes[1], uint8_t(0x7F));
    }

    // ── I24 ─────────────────────────────────────────────────────
    void i24_signExtension()
    {
        const uint8_t minusOne[3] = { 0xFF, 0xFF, 0xFF };
        QCOMPARE(SampleConverter::i24ToCanonical(minusOne), -1.0 / 8388608.0);

        const uint8_t most[3] = { 0x00, 0x00, 0x80 };
        QCOMPARE(SampleConverter::i24ToCanonical(most), -1.0);
    }

    void i24_fullScaleBytes()
    {
        uint8_t b[3] = {};
        SampleConverter::canonicalToI24(1.0, b);
        QCOMPARE(b[0], uint8_t(0xFF));
        QCOMPARE(b[1], uint8_t(0xFF));
        QCOMPARE(b[2], uint8_t(0x7F));

        SampleConverter::canonicalToI24(-1.0, b);
        QCOMPARE(b[0], uint8_t(0x00));
        QCOMPARE(b[1], uint8_t(0x00));
        QCOMPARE(b[2], uint8_t(0x80));
    }

    void i24_everyCodeRoundTripsExactly()
    {
        int mismatches = 0;
        uint8_t in[3];
        uint8_t out[3];
        for (uint32_t code = 0; code < (1u << 24); ++code) {
            in[0] = uint8_t(code & 0xFF);
            in[1] = uint8_t((code >> 8) & 0xFF);
            in[2] = uint8_t((code >> 16) & 0xFF);
            SampleConverter::canonicalToI24(SampleConverter::i24ToCanonical(in), out);
            if (std::memcmp(in, out, 3) != 0) ++mismatches;
        }
        QCOMPARE(mismatches, 0);
    }

    void i24_bytePathIsBitExact()
    {
        const std::vector<uint8_t> bytes = { 0xFF, 0xFF, 0x7F,   0x00, 0x00, 0x80,
                                             0x01, 0x00, 0x00,   0x56, 0x34, 0x12 };
        auto canonical = SampleConverter::toCanonical(bytes, SampleFormat::I24);
        QVERIFY(canonical.has_value());
        QCOMPARE(SampleConverter::fromCanonical(*canonical, SampleFormat::I24), bytes);
    }

    void i24_roundTrip()
    {
        std::vector<double> in = { -0.75, -0.1, 0.0, 0.333, 0.9 };
        auto bytes = SampleConverter::fromCanonical(in, SampleFormat::I24);
        QCOMPARE(bytes.size(), size_t(15));
        auto back = SampleConverter::toCanonical(bytes, SampleFormat::I24);
        QVERIFY(back.has_value());
        for (size_t i = 0; i < in.size(); ++i)
            QVERIFY(std::abs((*back)[i] - in[i]) <= 2.0 / 8388608.0);
    }

    // ── Unsigned ────────────────────────────────────────────────
    void u8_mapping()
    {
        auto c = SampleConverter::toCanonical(std::vector<uint8_t>{0, 255}, SampleFormat::U8);
        QVERIFY(c.has_value());
        QCOMPARE((*c)[0], -1.0);
        QCOMPARE((*c)[1], 1.0);

        auto bytes = SampleConverter::fromCanonical(std::vector<double>{-1.0, 0.0, 1.0}, SampleFormat::U8);
        QCOMPARE(bytes[0], uint8_t(0));
        QCOMPARE(bytes[1], uint8_t(127));
        QCOMPARE(bytes[2], uint8_t(255));
    }

    void u16_extremes()
    {
        auto bytes = SampleConverter::fromCanonical(std::vector<double>{-1.0, 1.0}, SampleFormat::U16);
        QCOMPARE(bytes[0], uint8_t(0));
        QCOMPARE(bytes[1], uint8_t(0));
        QCOMPARE(bytes[2], uint8_t(0xFF));
        QCOMPARE(bytes[3], uint8_t(0xFF));
    }

    // ── Float ───────────────────────────────────────────────────
    void f32_exactForRepresentableValues()
    {
        std::vector<double> in = { -1.0, -0.5, 0.25, 0.75, 1.0 };
        auto back = SampleConverter::toCanonical(SampleConverter::fromCanonical(in, SampleFormat::F32),
                                                 SampleFormat::F32);
        QVERIFY(back.has_value());
        for (size_t i = 0; i < in.size(); ++i)
            QCOMPARE((*back)[i], in[i]);
    }

    void f64_passesThrough()
    {
        std::vector<double> in = { 0.123456789012345, -0.987654321 };
        auto back = SampleConverter::toCanonical(SampleConverter::fromCanonical(in, SampleFormat::F64),
                                                 SampleFormat::F64);
        QVERIFY(back.has_value());
        QCOMPARE(*back, in);
    }

    // ── Errors ──────────────────────────────────────────────────
    void misalignedLength_isFormatError()
    {
        AudioError err;
        auto r = SampleConverter::toCanonical(std::vector<uint8_t>{1, 2, 3}, SampleFormat::I16, &err);
        QVERIFY(!r.has_value());
        QCOMPARE(err.kind, AudioError::AudioFormat);

        QVERIFY(!SampleConverter::toCanonical(std::vector<uint8_t>(7), SampleFormat::I24).has_value());
        QVERIFY(SampleConverter::toCanonical(std::vector<uint8_t>(), SampleFormat::I32).has_value());
    }
};

QTEST_MAIN(tst_SampleConverter)
#include "tst_SampleConverter.moc"
