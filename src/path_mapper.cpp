#include "path_mapper.h"
#include "errors.h"
#include "tree_walker.h"
#include "utils.h"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

#include <algorithm>

static QString normalizedRoot(const QString& path)
{
    const QFileInfo fi(path);
    const QString canonical = fi.canonicalFilePath();
    return canonical.isEmpty() ? QDir::cleanPath(fi.absoluteFilePath()) : canonical;
}

PathMapper::PathMapper(const QString& sourceRoot, const QString& destinationRoot,
                       const QSet<QString>& transcodeFormats, const QString& targetFormat,
                       bool includeHidden)
    : m_srcRoot(normalizedRoot(sourceRoot))
    , m_destRoot(normalizedRoot(destinationRoot))
    , m_targetFormat(targetFormat.toLower())
    , m_includeHidden(includeHidden)
{
    for (const QString& ext : transcodeFormats) {
        m_transcodeFormats.insert(ext.toLower());
    }
}

QString PathMapper::map(const QString& sourcePath) const
{
    const QString abs = QDir::cleanPath(QDir(m_srcRoot).absoluteFilePath(sourcePath));
    if (!Utils::isSubpath(abs, m_srcRoot)) {
        throw PathOutsideRootError(QString("Path is not in source directory: %1").arg(sourcePath));
    }
    const QString rel = QDir(m_srcRoot).relativeFilePath(abs);
    const QPair<QString, QString> parts = Utils::splitExtension(rel);
    QString destRel = rel;
    if (m_transcodeFormats.contains(parts.second.toLower())) {
        QString base = parts.first;
        if (parts.second.isEmpty() && !base.endsWith('.')) base += '.';
        destRel = base + m_targetFormat;
    }
    return QDir::cleanPath(QDir(m_destRoot).filePath(destRel));
}

QStringList PathMapper::sourceFiles() const
{
    return TreeWalker::walkFiles(m_srcRoot, m_includeHidden);
}

QList<TransferUnit> PathMapper::enumerateUnits(const std::optional<QString>& encoderOptions, bool useChecksum) const
{
    QList<TransferUnit> units;
    const QStringList files = sourceFiles();
    units.reserve(files.size());
    for (const QString& f : files) {
        units.push_back(TransferUnit(f, map(f), encoderOptions, useChecksum));
    }
    return units;
}

QStringList PathMapper::targetFiles() const
{
    QStringList out;
    const QStringList files = sourceFiles();
    out.reserve(files.size());
    for (const QString& f : files) out << map(f);
    return out;
}

QStringList PathMapper::extraDestinationFiles() const
{
    const QStringList targets = targetFiles();
    const QSet<QString> targetSet(targets.cbegin(), targets.cend());
    QStringList extra;
    const QStringList existing = TreeWalker::walkFiles(m_destRoot, m_includeHidden);
    for (const QString& f : existing) {
        if (!targetSet.contains(f)) extra << f;
    }
    std::sort(extra.begin(), extra.end());
    return extra;
}
