#pragma once
#include <QDir>
#include <QFileInfo>
#include <QPair>
#include <QString>

namespace Utils {

// Split a path into (base, extension) where the dot stays with the base.
// Only the file name is considered, and leading dots of the file name never
// start an extension: "a/b.c.flac" -> ("a/b.c.", "flac"), ".profile" -> (".profile", "").
inline QPair<QString, QString> splitExtension(const QString& path) {
    const int slash = path.lastIndexOf(QLatin1Char('/'));
    int nameStart = slash + 1;
    while (nameStart < path.size() && path.at(nameStart) == QLatin1Char('.')) ++nameStart;
    const int dot = path.lastIndexOf(QLatin1Char('.'));
    if (dot < nameStart) return qMakePair(path, QString());
    return qMakePair(path.left(dot + 1), path.mid(dot + 1));
}

// Lower-cased extension of a path, without the dot.
inline QString extensionOf(const QString& path) {
    return splitExtension(path).second.toLower();
}

// True if path equals parent or lies below it. Both must be absolute.
inline bool isSubpath(const QString& path, const QString& parent) {
    const QString rel = QDir(parent).relativeFilePath(path);
    return rel != QLatin1String("..") && !rel.startsWith(QLatin1String("../")) && !QFileInfo(rel).isAbsolute();
}

} // namespace Utils
