#include "tag_store.h"
#include "errors.h"

#include <QDebug>

FilteredTagStore::FilteredTagStore(std::unique_ptr<TagStore> inner, const QList<QRegularExpression>& blacklist)
    : m_inner(std::move(inner)), m_blacklist(blacklist)
{
}

bool FilteredTagStore::isBlacklisted(const QString& key) const
{
    for (const QRegularExpression& rx : m_blacklist) {
        if (rx.match(key).hasMatch()) return true;
    }
    return false;
}

QStringList FilteredTagStore::keys() const
{
    QStringList out;
    const QStringList all = m_inner->keys();
    for (const QString& k : all) {
        if (!isBlacklisted(k)) out << k;
    }
    return out;
}

bool FilteredTagStore::contains(const QString& key) const
{
    return !isBlacklisted(key) && m_inner->contains(key);
}

QString FilteredTagStore::value(const QString& key) const
{
    if (isBlacklisted(key)) {
        qDebug() << "[Tags] Attempted to get blacklisted key:" << key;
        return QString();
    }
    return m_inner->value(key);
}

void FilteredTagStore::setValue(const QString& key, const QString& value)
{
    if (isBlacklisted(key)) {
        qDebug() << "[Tags] Attempted to set blacklisted key:" << key;
        return;
    }
    m_inner->setValue(key, value);
}

void FilteredTagStore::remove(const QString& key)
{
    if (isBlacklisted(key)) {
        qDebug() << "[Tags] Attempted to remove blacklisted key:" << key;
        return;
    }
    m_inner->remove(key);
}

namespace TagTools {

const QString kChecksumKey = QStringLiteral("transfercoder_src_checksum");

static QRegularExpression caseless(const QString& pattern)
{
    return QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption);
}

QList<QRegularExpression> defaultBlacklist()
{
    return {
        caseless("encoded"),
        caseless("replaygain"),
        caseless("^r128_"),
        caseless("^encoder$"),
    };
}

int stripGainTags(TagStore& store)
{
    static const QRegularExpression gain = caseless("replaygain|^r128_");
    int removed = 0;
    const QStringList all = store.keys();
    for (const QString& k : all) {
        if (gain.match(k).hasMatch()) {
            store.remove(k);
            ++removed;
        }
    }
    return removed;
}

void copyTags(const TagBackend& backend, const QString& src, const QString& dest)
{
    QString err;
    std::unique_ptr<TagStore> srcRaw = backend.open(src, &err);
    if (!srcRaw) {
        throw TranscodeError(QString("Unable to read tags from %1: %2").arg(src, err));
    }
    std::unique_ptr<TagStore> destRaw = backend.open(dest, &err);
    if (!destRaw) {
        throw TranscodeError(QString("Unable to read tags from %1: %2").arg(dest, err));
    }

    const QList<QRegularExpression> blacklist = defaultBlacklist();
    FilteredTagStore srcTags(std::move(srcRaw), blacklist);
    FilteredTagStore destTags(std::move(destRaw), blacklist);

    if (!destTags.supportsTags()) {
        qWarning() << "[Tags] No tags copied because output format does not support tags:" << dest;
        return;
    }

    const int stripped = stripGainTags(destTags.inner());
    if (stripped > 0) {
        qDebug() << "[Tags] Removed" << stripped << "gain tag(s) from" << dest;
    }

    const QStringList old = destTags.keys();
    for (const QString& k : old) destTags.remove(k);

    const QStringList keys = srcTags.keys();
    for (const QString& k : keys) {
        const QString v = srcTags.value(k);
        qDebug().noquote() << "[Tags]" << k << "=" << v;
        destTags.setValue(k, v);
    }

    if (!destTags.save(&err)) {
        throw TranscodeError(QString("Unable to save tags to %1: %2").arg(dest, err));
    }
}

QString readChecksumTag(const TagBackend& backend, const QString& path)
{
    QString err;
    std::unique_ptr<TagStore> store = backend.open(path, &err);
    if (!store) {
        qDebug() << "[Tags] Could not read checksum tag from" << path << "-" << err;
        return QString();
    }
    return store->value(kChecksumKey);
}

bool writeChecksumTag(const TagBackend& backend, const QString& path, const QString& checksum)
{
    QString err;
    std::unique_ptr<TagStore> store = backend.open(path, &err);
    if (!store || !store->supportsTags()) {
        qWarning() << "[Tags] Could not write checksum tag to" << path << (err.isEmpty() ? QString() : "-" + err);
        return false;
    }
    store->setValue(kChecksumKey, checksum);
    if (!store->save(&err)) {
        qWarning() << "[Tags] Could not write checksum tag to" << path << "-" << err;
        return false;
    }
    return true;
}

} // namespace TagTools
