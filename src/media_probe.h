#pragma once
#include <QMap>
#include <QString>

namespace MediaInfo {
struct AudioProbe {
    QString container;   // e.g. flac, ogg, mp3
    QString audioCodec;
    int sampleRate = 0;
    int channels = 0;
    qint64 durationMs = 0;
    qint64 bitrate = 0;
};

// Opens a file with libavformat and looks for an audio stream.
// Returns true only if the file is a readable container with at least one audio stream.
bool probeAudioFile(const QString& filePath, AudioProbe& out, QString* errorMessage = nullptr);

// Reads container-level and first-audio-stream metadata. Keys are lower-cased;
// container values win over stream values for the same key.
bool readMetadata(const QString& filePath, QMap<QString, QString>& out, QString* errorMessage = nullptr);
}
