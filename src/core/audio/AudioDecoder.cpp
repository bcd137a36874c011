#include "AudioDecoder.h"
#include <QDebug>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

#include <memory>

namespace {

QString avErrorString(int err)
{
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return QString::fromUtf8(buf);
}

// Native precision of the codec output, reported as the stream's format
SampleFormat nativeSampleFormat(const AVCodecContext* ctx)
{
    switch (av_get_packed_sample_fmt(ctx->sample_fmt)) {
    case AV_SAMPLE_FMT_U8:  return SampleFormat::U8;
    case AV_SAMPLE_FMT_S16: return SampleFormat::I16;
    case AV_SAMPLE_FMT_S32:
        return ctx->bits_per_raw_sample == 24 ? SampleFormat::I24 : SampleFormat::I32;
    case AV_SAMPLE_FMT_FLT: return SampleFormat::F32;
    case AV_SAMPLE_FMT_DBL: return SampleFormat::F64;
    default:                return SampleFormat::F32;
    }
}

} // namespace

struct AudioDecoder::Impl {
    AVFormatContext* fmtCtx   = nullptr;
    AVCodecContext*  codecCtx = nullptr;
    SwrContext*      swrCtx   = nullptr;
    AVPacket*        packet   = nullptr;
    AVFrame*         frame    = nullptr;

    int              audioStreamIndex = -1;
    AudioFormat      streamFormat;
    std::optional<uint64_t> totalFrames;
    bool             opened   = false;
    bool             draining = false;   // flush packet sent, collecting tail frames
    bool             finished = false;
    AudioError       error;

    ~Impl() {
        cleanup();
    }

    void cleanup() {
        if (frame)    { av_frame_free(&frame); }
        if (packet)   { av_packet_free(&packet); }
        if (swrCtx)   { swr_free(&swrCtx); }
        if (codecCtx) { avcodec_free_context(&codecCtx); }
        if (fmtCtx)   { avformat_close_input(&fmtCtx); }
        audioStreamIndex = -1;
        totalFrames.reset();
        opened = false;
        draining = false;
        finished = false;
    }

    bool fail(AudioError::Kind kind, const QString& message) {
        error = AudioError(kind, message);
        qWarning() << "[Decoder]" << message;
        cleanup();
        return false;
    }

    // Converts the frame in `frame` and appends it to `out`. Returns frames.
    int convertFrame(std::vector<double>& out) {
        const int channels = streamFormat.channels;
        const int capacity = swr_get_out_samples(swrCtx, frame->nb_samples);
        if (capacity <= 0) return 0;

        const size_t start = out.size();
        out.resize(start + (size_t)capacity * channels);
        uint8_t* dst = reinterpret_cast<uint8_t*>(out.data() + start);

        int converted = swr_convert(swrCtx, &dst, capacity,
                                    (const uint8_t**)frame->extended_data,
                                    frame->nb_samples);
        av_frame_unref(frame);
        if (converted < 0) {
            out.resize(start);
            error = AudioError(AudioError::Decoding,
                               QStringLiteral("swr_convert failed: %1").arg(avErrorString(converted)));
            return -1;
        }
        out.resize(start + (size_t)converted * channels);
        return converted;
    }
};

AudioDecoder::AudioDecoder()
    : m_impl(std::make_unique<Impl>())
{
}

AudioDecoder::~AudioDecoder() = default;

bool AudioDecoder::open(const QString& filePath)
{
    close();

    auto& d = *m_impl;
    d.error = AudioError();
    const QByteArray path = filePath.toUtf8();

    // Open input
    int ret = avformat_open_input(&d.fmtCtx, path.constData(), nullptr, nullptr);
    if (ret < 0)
        return d.fail(AudioError::Io,
                      QStringLiteral("Cannot open %1: %2").arg(filePath, avErrorString(ret)));

    if (avformat_find_stream_info(d.fmtCtx, nullptr) < 0)
        return d.fail(AudioError::Decoding, QStringLiteral("No stream info in %1").arg(filePath));

    // Find best audio stream
    d.audioStreamIndex = av_find_best_stream(d.fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (d.audioStreamIndex < 0)
        return d.fail(AudioError::Decoding, QStringLiteral("No audio stream in %1").arg(filePath));

    AVStream* stream = d.fmtCtx->streams[d.audioStreamIndex];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec)
        return d.fail(AudioError::Decoding,
                      QStringLiteral("Unsupported codec %1")
                          .arg(QString::fromUtf8(avcodec_get_name(stream->codecpar->codec_id))));

    d.codecCtx = avcodec_alloc_context3(codec);
    if (!d.codecCtx)
        return d.fail(AudioError::Decoding, QStringLiteral("avcodec_alloc_context3 failed"));
    if (avcodec_parameters_to_context(d.codecCtx, stream->codecpar) < 0)
        return d.fail(AudioError::Decoding, QStringLiteral("avcodec_parameters_to_context failed"));
    if ((ret = avcodec_open2(d.codecCtx, codec, nullptr)) < 0)
        return d.fail(AudioError::Decoding,
                      QStringLiteral("avcodec_open2 failed: %1").arg(avErrorString(ret)));

    int channels = d.codecCtx->ch_layout.nb_channels;
    if (channels == 0) channels = 2;

    d.streamFormat = AudioFormat((uint32_t)d.codecCtx->sample_rate, channels,
                                 nativeSampleFormat(d.codecCtx));
    QString formatError = d.streamFormat.validate();
    if (!formatError.isEmpty())
        return d.fail(AudioError::Decoding, formatError);

    // Convert to interleaved double, same rate and layout
    AVChannelLayout outLayout;
    av_channel_layout_default(&outLayout, channels);

    ret = swr_alloc_set_opts2(
        &d.swrCtx,
        &outLayout,                    // out layout
        AV_SAMPLE_FMT_DBL,             // out format: interleaved f64
        d.codecCtx->sample_rate,       // out sample rate
        &d.codecCtx->ch_layout,        // in layout
        d.codecCtx->sample_fmt,        // in format
        d.codecCtx->sample_rate,       // in sample rate
        0, nullptr
    );
    av_channel_layout_uninit(&outLayout);

    if (ret < 0 || swr_init(d.swrCtx) < 0)
        return d.fail(AudioError::Decoding, QStringLiteral("swresample setup failed"));

    d.packet = av_packet_alloc();
    d.frame  = av_frame_alloc();
    if (!d.packet || !d.frame)
        return d.fail(AudioError::Decoding, QStringLiteral("Out of memory"));

    // Negative or unknown header durations leave the duration unset
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        d.totalFrames = (uint64_t)av_rescale_q(stream->duration, stream->time_base,
                                               AVRational{1, d.codecCtx->sample_rate});
    } else if (d.fmtCtx->duration != AV_NOPTS_VALUE && d.fmtCtx->duration > 0) {
        d.totalFrames = (uint64_t)((double)d.fmtCtx->duration / AV_TIME_BASE
                                   * d.codecCtx->sample_rate);
    }

    d.opened = true;
    qDebug() << "[Decoder] Opened" << filePath << codecName() << d.streamFormat.toString();
    return true;
}

void AudioDecoder::close()
{
    m_impl->cleanup();
}

bool AudioDecoder::isOpen() const
{
    return m_impl->opened;
}

std::optional<DecodedPacket> AudioDecoder::decodeNext()
{
    auto& d = *m_impl;
    if (!d.opened || d.finished) return std::nullopt;
    d.error = AudioError();

    DecodedPacket out;
    out.format = d.streamFormat;
    out.samples.reserve((size_t)kPacketFrames * d.streamFormat.channels);

    while ((int)out.frames < kPacketFrames) {
        // Drain whatever the codec already has
        int ret = avcodec_receive_frame(d.codecCtx, d.frame);
        if (ret == 0) {
            int n = d.convertFrame(out.samples);
            if (n < 0) return std::nullopt;
            out.frames += (size_t)n;
            continue;
        }
        if (ret == AVERROR_EOF) {
            d.finished = true;
            break;
        }
        if (ret != AVERROR(EAGAIN)) {
            d.error = AudioError(AudioError::Decoding,
                                 QStringLiteral("Decode failed: %1").arg(avErrorString(ret)));
            return std::nullopt;
        }
        if (d.draining) {
            d.finished = true;
            break;
        }

        // Codec wants input
        ret = av_read_frame(d.fmtCtx, d.packet);
        if (ret == AVERROR_EOF) {
            avcodec_send_packet(d.codecCtx, nullptr);
            d.draining = true;
            continue;
        }
        if (ret < 0) {
            d.error = AudioError(AudioError::Io,
                                 QStringLiteral("Read failed: %1").arg(avErrorString(ret)));
            return std::nullopt;
        }

        if (d.packet->stream_index != d.audioStreamIndex) {
            av_packet_unref(d.packet);
            continue;
        }

        ret = avcodec_send_packet(d.codecCtx, d.packet);
        av_packet_unref(d.packet);
        if (ret < 0 && ret != AVERROR(EAGAIN))
            qWarning() << "[Decoder] Skipping corrupt packet:" << avErrorString(ret);
    }

    if (out.frames == 0) return std::nullopt;
    return out;
}

bool AudioDecoder::seek(uint64_t frame)
{
    auto& d = *m_impl;
    if (!d.opened) return false;

    AVStream* stream = d.fmtCtx->streams[d.audioStreamIndex];
    int64_t ts = av_rescale_q((int64_t)frame, AVRational{1, (int)d.streamFormat.sampleRate},
                              stream->time_base);

    int ret = av_seek_frame(d.fmtCtx, d.audioStreamIndex, ts, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        d.error = AudioError(AudioError::Decoding,
                             QStringLiteral("Seek failed: %1").arg(avErrorString(ret)));
        return false;
    }

    avcodec_flush_buffers(d.codecCtx);
    d.draining = false;
    d.finished = false;
    return true;
}

AudioFormat AudioDecoder::format() const
{
    return m_impl->streamFormat;
}

std::optional<uint64_t> AudioDecoder::duration() const
{
    return m_impl->totalFrames;
}

QString AudioDecoder::codecName() const
{
    auto& d = *m_impl;
    if (!d.opened || !d.codecCtx) return QString();
    return QString::fromUtf8(avcodec_get_name(d.codecCtx->codec_id));
}

AudioError AudioDecoder::lastError() const
{
    return m_impl->error;
}
