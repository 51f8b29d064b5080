#pragma once
#include <QString>
#include <QStringList>
#include <atomic>

// External transcoding engine seam. Implementations throw TranscodeError on
// failure and CancelledError when the cancel flag aborts the work.
class TranscodeEngine {
public:
    virtual ~TranscodeEngine() = default;

    // True if the engine can be invoked at all.
    virtual bool isAvailable() const = 0;

    // True if path is a media file the engine can decode.
    virtual bool identify(const QString& path, QString* errorMessage = nullptr) const = 0;

    // Decode input and encode it to output using the given encoder flags.
    // The caller checks independently that output exists afterwards.
    virtual void transcode(const QString& input, const QString& output, const QStringList& encoderFlags,
                           const std::atomic_bool* cancel) const = 0;
};

// Runs the ffmpeg executable; probes inputs in-process with libavformat.
class FfmpegEngine : public TranscodeEngine {
public:
    explicit FfmpegEngine(const QString& ffmpegPath = QStringLiteral("ffmpeg"));

    QString ffmpegPath() const { return m_ffmpegPath; }

    bool isAvailable() const override;
    bool identify(const QString& path, QString* errorMessage = nullptr) const override;
    void transcode(const QString& input, const QString& output, const QStringList& encoderFlags,
                   const std::atomic_bool* cancel) const override;

    // Full argument list for one transcode.
    static QStringList buildArguments(const QString& input, const QString& output, const QStringList& encoderFlags);

private:
    QString m_ffmpegPath;
};
