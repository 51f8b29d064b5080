#pragma once
#include <QList>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <memory>

// Dict-like view over a media file's metadata. Keys are case-insensitive and
// reported lower-cased. Changes are held in memory until save().
class TagStore {
public:
    virtual ~TagStore() = default;

    virtual QString path() const = 0;
    virtual QStringList keys() const = 0;
    virtual bool contains(const QString& key) const = 0;
    virtual QString value(const QString& key) const = 0;

    // Tags the container cannot represent are skipped, not reported as errors.
    virtual void setValue(const QString& key, const QString& value) = 0;
    virtual void remove(const QString& key) = 0;

    // False if the container carries no tags at all.
    virtual bool supportsTags() const = 0;

    virtual bool save(QString* errorMessage = nullptr) = 0;
};

// Opens TagStores for files. Returns nullptr (and fills errorMessage) when the
// file cannot be identified as a media file.
class TagBackend {
public:
    virtual ~TagBackend() = default;
    virtual std::unique_ptr<TagStore> open(const QString& path, QString* errorMessage = nullptr) const = 0;
};

// Decorator hiding blacklisted keys: they can be neither read, set nor removed
// through this view.
class FilteredTagStore : public TagStore {
public:
    FilteredTagStore(std::unique_ptr<TagStore> inner, const QList<QRegularExpression>& blacklist);

    bool isBlacklisted(const QString& key) const;
    TagStore& inner() { return *m_inner; }

    QString path() const override { return m_inner->path(); }
    QStringList keys() const override;
    bool contains(const QString& key) const override;
    QString value(const QString& key) const override;
    void setValue(const QString& key, const QString& value) override;
    void remove(const QString& key) override;
    bool supportsTags() const override { return m_inner->supportsTags(); }
    bool save(QString* errorMessage = nullptr) override { return m_inner->save(errorMessage); }

private:
    std::unique_ptr<TagStore> m_inner;
    QList<QRegularExpression> m_blacklist;
};

namespace TagTools {

// Custom field holding the source checksum in destination files.
extern const QString kChecksumKey;

// Format-internal and loudness-normalization keys that never transfer between files.
QList<QRegularExpression> defaultBlacklist();

// Removes replaygain/R128 gain keys. Returns the number of keys removed.
int stripGainTags(TagStore& store);

// Replace the destination's transferable tags with the source's, dropping gain
// tags from the destination. Throws TranscodeError when either file's tags can't
// be read or the destination can't be saved. A destination format without tag
// support only produces a warning.
void copyTags(const TagBackend& backend, const QString& src, const QString& dest);

// Saved checksum, or an empty string if the file is unreadable or lacks the tag.
QString readChecksumTag(const TagBackend& backend, const QString& path);

// Soft failure: logs a warning and returns false.
bool writeChecksumTag(const TagBackend& backend, const QString& path, const QString& checksum);

} // namespace TagTools
