#include "file_copier.h"
#include "errors.h"
#include "file_utils.h"
#include "process_runner.h"

#include <QFile>
#include <QDebug>

namespace FileCopier {

namespace {
constexpr qint64 kChunkSize = 4 * 1024 * 1024;
}

bool copyFile(const QString& src, const QString& dst, const std::atomic_bool* cancel, QString* errorMessage)
{
    QFile in(src); QFile out(dst);
    if (!in.open(QIODevice::ReadOnly)) { if (errorMessage) *errorMessage = QString("Failed to open %1: %2").arg(src, in.errorString()); return false; }
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) { if (errorMessage) *errorMessage = QString("Failed to write %1: %2").arg(dst, out.errorString()); return false; }
    QByteArray buf; buf.resize(kChunkSize);
    while (!in.atEnd()) {
        if (cancel && cancel->load()) {
            out.close(); out.remove();
            if (errorMessage) *errorMessage = QString("Copy of %1 was cancelled").arg(src);
            return false;
        }
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0) { if (errorMessage) *errorMessage = QString("Read error %1").arg(src); out.close(); out.remove(); return false; }
        if (r == 0) break;
        const qint64 w = out.write(buf.constData(), r);
        if (w != r) { if (errorMessage) *errorMessage = QString("Write error %1").arg(dst); out.close(); out.remove(); return false; }
    }
    if (!out.flush()) { if (errorMessage) *errorMessage = QString("Write error %1").arg(dst); out.close(); out.remove(); return false; }
    out.close(); in.close();
    return true;
}

void copy(const QString& src, const QString& dst, const QString& rsyncPath, const std::atomic_bool* cancel)
{
    if (!rsyncPath.isEmpty()) {
        const ProcessRunner::Result r = ProcessRunner::run(rsyncPath, {"-q", "-p", src, dst}, cancel);
        if (r.cancelled) {
            QFile::remove(dst);
            throw CancelledError(QString("Copy of %1 was cancelled").arg(src));
        }
        if (r.succeeded()) return;
        qDebug() << "[Copy] Fast copy failed, falling back to plain copy:" << ProcessRunner::describeFailure(rsyncPath, r);
    }

    QString err;
    if (!copyFile(src, dst, cancel, &err)) {
        if (cancel && cancel->load()) throw CancelledError(err);
        throw CopyError(err);
    }
    if (!FileUtils::copyMode(src, dst)) {
        throw CopyError(QString("Failed to copy permissions from %1 to %2").arg(src, dst));
    }
}

} // namespace FileCopier
