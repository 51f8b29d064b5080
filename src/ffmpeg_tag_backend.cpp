#include "ffmpeg_tag_backend.h"
#include "file_utils.h"
#include "media_probe.h"
#include "process_runner.h"
#include "utils.h"

#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QTemporaryFile>
#include <QDebug>

#include <cstdio>

namespace {
// Containers that carry comments per stream rather than globally.
const QSet<QString>& streamCommentFormats()
{
    static const QSet<QString> s = {"ogg", "oga", "opus", "spx"};
    return s;
}
// MP4 family only keeps custom keys with use_metadata_tags.
const QSet<QString>& mp4Formats()
{
    static const QSet<QString> s = {"m4a", "m4b", "m4p", "mp4", "mov", "3gp"};
    return s;
}
// Raw elementary streams without any tag container.
const QSet<QString>& untaggedFormats()
{
    static const QSet<QString> s = {"aac", "ac3", "amr", "adts"};
    return s;
}
}

FfmpegTagStore::FfmpegTagStore(const QString& path, const QString& ffmpegPath, const QMap<QString, QString>& tags)
    : m_path(path), m_ffmpegPath(ffmpegPath)
{
    for (auto it = tags.constBegin(); it != tags.constEnd(); ++it) {
        m_tags.insert(it.key().toLower(), it.value());
    }
}

bool FfmpegTagStore::supportsTags() const
{
    return !untaggedFormats().contains(Utils::extensionOf(m_path));
}

void FfmpegTagStore::setValue(const QString& key, const QString& value)
{
    if (!supportsTags()) {
        qDebug() << "[Tags] Skipping unsupported tag" << key << "for" << m_path;
        return;
    }
    const QString k = key.toLower();
    if (m_tags.value(k) == value && m_tags.contains(k)) return;
    m_tags.insert(k, value);
    m_dirty = true;
}

void FfmpegTagStore::remove(const QString& key)
{
    if (m_tags.remove(key.toLower()) > 0) m_dirty = true;
}

QStringList FfmpegTagStore::buildSaveArguments(const QString& input, const QString& output, const QMap<QString, QString>& tags)
{
    const QString ext = Utils::extensionOf(output);
    QStringList args;
    args << "-hide_banner" << "-nostdin" << "-v" << "error" << "-y";
    args << "-i" << input;
    args << "-map" << "0" << "-c" << "copy" << "-map_metadata" << "-1";
    const bool perStream = streamCommentFormats().contains(ext);
    for (auto it = tags.constBegin(); it != tags.constEnd(); ++it) {
        const QString kv = QString("%1=%2").arg(it.key(), it.value());
        args << "-metadata" << kv;
        if (perStream) args << "-metadata:s:a:0" << kv;
    }
    if (mp4Formats().contains(ext)) {
        args << "-movflags" << "use_metadata_tags";
    }
    args << output;
    return args;
}

bool FfmpegTagStore::save(QString* errorMessage)
{
    if (!m_dirty) return true;

    QFileInfo fi(m_path);
    const QString suffix = fi.suffix().isEmpty() ? QString() : "." + fi.suffix();
    // Dot-prefixed so an interrupted save is never picked up as a regular file by the walker.
    QTemporaryFile tmp(QDir(fi.absolutePath()).filePath("." + fi.completeBaseName() + ".tags_XXXXXX" + suffix));
    if (!tmp.open()) {
        if (errorMessage) *errorMessage = QString("cannot create temp file next to %1: %2").arg(m_path, tmp.errorString());
        return false;
    }
    const QString tmpName = tmp.fileName();
    tmp.close();

    const QFileDevice::Permissions perms = QFile::permissions(m_path);
    const ProcessRunner::Result r = ProcessRunner::run(m_ffmpegPath, buildSaveArguments(m_path, tmpName, m_tags));
    if (!r.succeeded() || !FileUtils::fileExists(tmpName)) {
        if (errorMessage) *errorMessage = ProcessRunner::describeFailure(m_ffmpegPath, r);
        return false;
    }
    if (!QFile::setPermissions(tmpName, perms)) {
        qDebug() << "[Tags] Could not restore permissions on" << m_path;
    }

    // rename(2) replaces the original atomically.
    if (std::rename(QFile::encodeName(tmpName).constData(), QFile::encodeName(m_path).constData()) != 0) {
        if (errorMessage) *errorMessage = QString("cannot replace %1").arg(m_path);
        return false;
    }
    tmp.setAutoRemove(false);
    m_dirty = false;
    return true;
}

FfmpegTagBackend::FfmpegTagBackend(const QString& ffmpegPath)
    : m_ffmpegPath(ffmpegPath.isEmpty() ? QStringLiteral("ffmpeg") : ffmpegPath)
{
}

std::unique_ptr<TagStore> FfmpegTagBackend::open(const QString& path, QString* errorMessage) const
{
    if (!FileUtils::fileExists(path)) {
        if (errorMessage) *errorMessage = QString("no such file");
        return nullptr;
    }
    QMap<QString, QString> tags;
    QString err;
    if (!MediaInfo::readMetadata(path, tags, &err)) {
        if (errorMessage) *errorMessage = QString("Unable to identify %1 as a music file (%2)").arg(path, err);
        return nullptr;
    }
    return std::make_unique<FfmpegTagStore>(path, m_ffmpegPath, tags);
}
