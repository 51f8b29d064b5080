#pragma once
#include <QString>
#include <QStringList>
#include <atomic>

// Synchronous QProcess invocation for worker threads: stdin is the null
// device, stdout is discarded, stderr is captured. A raised cancel flag
// kills the child instead of waiting for it.
namespace ProcessRunner {

struct Result {
    bool started = false;
    bool cancelled = false;
    bool normalExit = false;
    int exitCode = -1;
    QString errorString;   // QProcess error when the program could not be started
    QString stdErr;

    bool succeeded() const { return started && !cancelled && normalExit && exitCode == 0; }
};

Result run(const QString& program, const QStringList& args, const std::atomic_bool* cancel = nullptr);

// Human-readable reason for a failed Result, for error messages.
QString describeFailure(const QString& program, const Result& r);

} // namespace ProcessRunner
