#pragma once
#include "transfer_unit.h"

#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <optional>

// Maps source paths to destination paths, substituting the target extension
// for files whose extension is in the transcode set.
class PathMapper {
public:
    PathMapper(const QString& sourceRoot, const QString& destinationRoot,
               const QSet<QString>& transcodeFormats, const QString& targetFormat,
               bool includeHidden = false);

    QString sourceRoot() const { return m_srcRoot; }
    QString destinationRoot() const { return m_destRoot; }

    // Throws PathOutsideRootError if path is not under the source root.
    // Relative paths are taken relative to the source root.
    QString map(const QString& sourcePath) const;

    // Fresh traversal of the source tree on every call.
    QStringList sourceFiles() const;
    QList<TransferUnit> enumerateUnits(const std::optional<QString>& encoderOptions, bool useChecksum) const;

    // Mapped destinations of every current source file.
    QStringList targetFiles() const;

    // Existing destination files that no source maps to, sorted ascending.
    QStringList extraDestinationFiles() const;

private:
    QString m_srcRoot;
    QString m_destRoot;
    QSet<QString> m_transcodeFormats;
    QString m_targetFormat;
    bool m_includeHidden = false;
};
