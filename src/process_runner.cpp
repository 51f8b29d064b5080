#include "process_runner.h"

#include <QFileInfo>
#include <QProcess>
#include <QDebug>

namespace ProcessRunner {

namespace {
constexpr int kPollIntervalMs = 100;
constexpr int kStartTimeoutMs = 30000;
constexpr int kStderrLimit = 64 * 1024;
}

Result run(const QString& program, const QStringList& args, const std::atomic_bool* cancel)
{
    Result r;
    if (cancel && cancel->load()) {
        r.cancelled = true;
        return r;
    }

    QProcess p;
    p.setProgram(program);
    p.setArguments(args);
    p.setStandardInputFile(QProcess::nullDevice());
    p.setStandardOutputFile(QProcess::nullDevice());
    qDebug() << "[Process] Calling command:" << QFileInfo(program).fileName() << args.join(' ');
    p.start();
    if (!p.waitForStarted(kStartTimeoutMs)) {
        r.errorString = p.errorString();
        return r;
    }
    r.started = true;

    QByteArray err;
    while (p.state() != QProcess::NotRunning) {
        if (p.waitForFinished(kPollIntervalMs)) break;
        err += p.readAllStandardError();
        if (err.size() > kStderrLimit) err = err.right(kStderrLimit);
        if (cancel && cancel->load()) {
            qDebug() << "[Process] Killing" << QFileInfo(program).fileName() << "after cancel request";
            p.kill();
            p.waitForFinished();
            r.cancelled = true;
            return r;
        }
    }
    err += p.readAllStandardError();
    r.stdErr = QString::fromUtf8(err.right(kStderrLimit)).trimmed();
    r.normalExit = (p.exitStatus() == QProcess::NormalExit);
    r.exitCode = p.exitCode();
    // A child that dies from the same SIGINT as us exits before the poll sees the flag.
    if (cancel && cancel->load() && !(r.normalExit && r.exitCode == 0)) {
        qDebug() << "[Process]" << QFileInfo(program).fileName() << "exited after cancel request";
        r.cancelled = true;
    }
    return r;
}

QString describeFailure(const QString& program, const Result& r)
{
    const QString name = QFileInfo(program).fileName();
    if (r.cancelled) return QString("%1 was cancelled").arg(name);
    if (!r.started) return QString("failed to start %1: %2").arg(name, r.errorString);
    if (!r.normalExit) return QString("%1 crashed").arg(name);
    QString msg = QString("%1 exited with code %2").arg(name).arg(r.exitCode);
    if (!r.stdErr.isEmpty()) msg += QString(": %1").arg(r.stdErr);
    return msg;
}

} // namespace ProcessRunner
