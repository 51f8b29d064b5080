#pragma once
#include "tag_store.h"

#include <QMap>

// Tags read in-process through libavformat and written by remuxing the file
// with `ffmpeg -c copy` into a sibling temp file that replaces the original.
class FfmpegTagStore : public TagStore {
public:
    FfmpegTagStore(const QString& path, const QString& ffmpegPath, const QMap<QString, QString>& tags);

    QString path() const override { return m_path; }
    QStringList keys() const override { return m_tags.keys(); }
    bool contains(const QString& key) const override { return m_tags.contains(key.toLower()); }
    QString value(const QString& key) const override { return m_tags.value(key.toLower()); }
    void setValue(const QString& key, const QString& value) override;
    void remove(const QString& key) override;
    bool supportsTags() const override;
    bool save(QString* errorMessage = nullptr) override;

    // Remux arguments that rewrite `input`'s metadata into `output`.
    static QStringList buildSaveArguments(const QString& input, const QString& output, const QMap<QString, QString>& tags);

private:
    QString m_path;
    QString m_ffmpegPath;
    QMap<QString, QString> m_tags;
    bool m_dirty = false;
};

class FfmpegTagBackend : public TagBackend {
public:
    explicit FfmpegTagBackend(const QString& ffmpegPath = QStringLiteral("ffmpeg"));
    std::unique_ptr<TagStore> open(const QString& path, QString* errorMessage = nullptr) const override;

private:
    QString m_ffmpegPath;
};
