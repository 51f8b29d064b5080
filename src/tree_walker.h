#pragma once
#include <QString>
#include <QStringList>

// Recursive listing of regular files below a root.
// Every call performs a fresh traversal and returns a materialized list.
namespace TreeWalker {

// True for dotfiles and dot-directories.
bool isHidden(const QString& name);

// Absolute paths of all regular files under root, in sorted directory order.
// Unless includeHidden is set, hidden files are skipped and hidden directories
// are not descended into. A missing root yields an empty list.
QStringList walkFiles(const QString& root, bool includeHidden);

} // namespace TreeWalker
