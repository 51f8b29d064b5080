#pragma once
#include <QString>
#include <atomic>

// Byte copy of a single file, preferring an external fast-copy tool.
namespace FileCopier {

// Plain chunked copy. Removes the partial destination if cancel is raised
// mid-copy. Returns false with errorMessage filled on failure.
bool copyFile(const QString& src, const QString& dst, const std::atomic_bool* cancel, QString* errorMessage = nullptr);

// Runs `rsyncPath -q -p src dst` when rsyncPath is non-empty; on any failure
// of the tool, falls back to copyFile followed by copying the mode bits.
// Throws CopyError if the fallback fails and CancelledError on cancel.
void copy(const QString& src, const QString& dst, const QString& rsyncPath, const std::atomic_bool* cancel = nullptr);

} // namespace FileCopier
