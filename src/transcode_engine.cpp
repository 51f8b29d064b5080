#include "transcode_engine.h"
#include "errors.h"
#include "media_probe.h"
#include "process_runner.h"

#include <QFileInfo>
#include <QDebug>

// Helper: prevent paths starting with '-' from being interpreted as flags
static QString safePath(const QString& p)
{
    if (!QFileInfo(p).isAbsolute() && p.startsWith('-')) {
        return QStringLiteral("./") + p;
    }
    return p;
}

FfmpegEngine::FfmpegEngine(const QString& ffmpegPath)
    : m_ffmpegPath(ffmpegPath.isEmpty() ? QStringLiteral("ffmpeg") : ffmpegPath)
{
}

bool FfmpegEngine::isAvailable() const
{
    const ProcessRunner::Result r = ProcessRunner::run(m_ffmpegPath, {"-version"});
    if (!r.succeeded()) {
        qDebug() << "[Engine]" << ProcessRunner::describeFailure(m_ffmpegPath, r);
    }
    return r.succeeded();
}

bool FfmpegEngine::identify(const QString& path, QString* errorMessage) const
{
    MediaInfo::AudioProbe probe;
    if (!MediaInfo::probeAudioFile(path, probe, errorMessage)) {
        return false;
    }
    qDebug() << "[Engine] Identified" << path << "as" << probe.container << "/" << probe.audioCodec;
    return true;
}

QStringList FfmpegEngine::buildArguments(const QString& input, const QString& output, const QStringList& encoderFlags)
{
    QStringList args;
    args << "-hide_banner" << "-nostdin" << "-v" << "error" << "-y";
    args << "-i" << safePath(input);
    args << "-vn";
    args << encoderFlags;
    args << safePath(output);
    return args;
}

void FfmpegEngine::transcode(const QString& input, const QString& output, const QStringList& encoderFlags,
                             const std::atomic_bool* cancel) const
{
    const QStringList args = buildArguments(input, output, encoderFlags);
    const ProcessRunner::Result r = ProcessRunner::run(m_ffmpegPath, args, cancel);
    if (r.cancelled) {
        throw CancelledError(QString("Transcode of %1 was cancelled").arg(input));
    }
    if (!r.succeeded()) {
        throw TranscodeError(ProcessRunner::describeFailure(m_ffmpegPath, r));
    }
}
