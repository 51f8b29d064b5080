#include "media_probe.h"
#include <QFile>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}

namespace MediaInfo {

namespace {

void quietFfmpegLog()
{
    // Reduce FFmpeg logging noise. Probes run on worker threads.
    static const bool logLevelSet = [] {
        av_log_set_level(AV_LOG_ERROR);
        return true;
    }();
    Q_UNUSED(logLevelSet);
}

bool openInput(const QString& filePath, AVFormatContext*& fmtCtx, QString* errorMessage)
{
    quietFfmpegLog();
    fmtCtx = nullptr;
    QByteArray localPath = QFile::encodeName(filePath);
    int ret = avformat_open_input(&fmtCtx, localPath.constData(), nullptr, nullptr);
    if (ret < 0) {
        if (errorMessage) *errorMessage = QString("avformat_open_input failed (%1)").arg(ret);
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        if (errorMessage) *errorMessage = QString("avformat_find_stream_info failed (%1)").arg(ret);
        avformat_close_input(&fmtCtx);
        return false;
    }
    return true;
}

void collect(const AVDictionary* dict, QMap<QString, QString>& out, bool overwrite)
{
    const AVDictionaryEntry* tag = nullptr;
    while ((tag = av_dict_get(dict, "", tag, AV_DICT_IGNORE_SUFFIX)) != nullptr) {
        const QString key = QString::fromUtf8(tag->key).toLower();
        if (!overwrite && out.contains(key)) continue;
        out.insert(key, QString::fromUtf8(tag->value));
    }
}

} // namespace

bool probeAudioFile(const QString& filePath, AudioProbe& out, QString* errorMessage)
{
    out = AudioProbe();

    AVFormatContext* fmtCtx = nullptr;
    if (!openInput(filePath, fmtCtx, errorMessage)) {
        return false;
    }

    if (fmtCtx->iformat && fmtCtx->iformat->name) {
        out.container = QString::fromUtf8(fmtCtx->iformat->name);
    }
    if (fmtCtx->duration > 0) {
        out.durationMs = fmtCtx->duration / (AV_TIME_BASE / 1000);
    }
    if (fmtCtx->bit_rate > 0) {
        out.bitrate = fmtCtx->bit_rate;
    }

    const int aIdx = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (aIdx < 0) {
        if (errorMessage) *errorMessage = QString("no audio stream found");
        avformat_close_input(&fmtCtx);
        return false;
    }

    const AVCodecParameters* ap = fmtCtx->streams[aIdx]->codecpar;
    if (ap) {
        const char* aname = avcodec_get_name(ap->codec_id);
        if (aname) out.audioCodec = QString::fromUtf8(aname);
        out.sampleRate = ap->sample_rate;
        out.channels = ap->ch_layout.nb_channels;
    }

    avformat_close_input(&fmtCtx);
    return true;
}

bool readMetadata(const QString& filePath, QMap<QString, QString>& out, QString* errorMessage)
{
    out.clear();

    AVFormatContext* fmtCtx = nullptr;
    if (!openInput(filePath, fmtCtx, errorMessage)) {
        return false;
    }

    collect(fmtCtx->metadata, out, true);

    // Ogg/Opus keep their comments on the stream rather than the container.
    const int aIdx = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (aIdx >= 0) {
        collect(fmtCtx->streams[aIdx]->metadata, out, false);
    }

    avformat_close_input(&fmtCtx);
    return true;
}

} // namespace MediaInfo
