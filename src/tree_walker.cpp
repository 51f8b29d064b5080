#include "tree_walker.h"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

namespace TreeWalker {

bool isHidden(const QString& name)
{
    return name.startsWith(QLatin1Char('.'));
}

QStringList walkFiles(const QString& root, bool includeHidden)
{
    QStringList files;
    if (!QFileInfo(root).isDir()) return files;

    // Depth-first, one directory level at a time so hidden dirs can be pruned.
    QStringList pending;
    pending.push_back(QFileInfo(root).absoluteFilePath());
    while (!pending.isEmpty()) {
        const QString cur = pending.takeLast();
        QDir d(cur);
        const QFileInfoList entries = d.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                                                      QDir::Name);
        QStringList subdirs;
        for (const QFileInfo& e : entries) {
            if (!includeHidden && isHidden(e.fileName())) continue;
            if (e.isDir()) {
                // Symlinked directories are listed but not followed.
                if (!e.isSymLink()) subdirs.push_back(e.absoluteFilePath());
            } else if (e.isFile()) {
                files.push_back(e.absoluteFilePath());
            } else {
                qDebug() << "[TreeWalker] Skipping non-regular entry" << e.absoluteFilePath();
            }
        }
        // Reverse so the first subdirectory is visited first.
        for (auto it = subdirs.crbegin(); it != subdirs.crend(); ++it) pending.push_back(*it);
    }
    return files;
}

} // namespace TreeWalker
