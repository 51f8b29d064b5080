#include "transfer_scheduler.h"
#include "errors.h"
#include "file_utils.h"
#include "path_mapper.h"
#include "transcode_engine.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFuture>
#include <QMutex>
#include <QMutexLocker>
#include <QQueue>
#include <QScopeGuard>
#include <QSet>
#include <QTemporaryDir>
#include <QThreadPool>
#include <QWaitCondition>
#include <QtConcurrent/QtConcurrentRun>
#include <QDebug>

#include <algorithm>

namespace {
constexpr int kResultPollMs = 100;
}

// Outcome of staging one unit on a worker thread.
struct TransferScheduler::StageResult {
    enum class Status { Staged, Failed, Cancelled };
    Status status;
    TransferUnit unit;
    QString error;
};

// Completed stage results, consumed by the transfer loop in completion order.
class TransferScheduler::ResultQueue {
public:
    void push(StageResult result)
    {
        QMutexLocker locker(&m_mutex);
        m_items.enqueue(std::move(result));
        m_ready.wakeOne();
    }

    std::optional<StageResult> pop(int timeoutMs)
    {
        QMutexLocker locker(&m_mutex);
        if (m_items.isEmpty()) m_ready.wait(&m_mutex, timeoutMs);
        if (m_items.isEmpty()) return std::nullopt;
        return m_items.dequeue();
    }

private:
    QMutex m_mutex;
    QWaitCondition m_ready;
    QQueue<StageResult> m_items;
};

TransferScheduler::TransferScheduler(const PathMapper& mapper, const TransferContext& ctx)
    : m_mapper(mapper), m_ctx(ctx)
{
}

QString TransferScheduler::stateName(State state)
{
    switch (state) {
    case State::Idle: return "Idle";
    case State::Enumerating: return "Enumerating";
    case State::Planning: return "Planning";
    case State::Transcoding: return "Transcoding";
    case State::Transferring: return "Transferring";
    case State::Cleanup: return "Cleanup";
    case State::Done: return "Done";
    case State::Interrupted: return "Interrupted";
    }
    return QString();
}

QString TransferScheduler::summaryBanner(const RunReport& report)
{
    if (report.outcome == RunReport::Outcome::Interrupted) return "Interrupted before all files were processed.";
    if (!report.failedFiles.isEmpty()) return "Finished with some errors (see above).";
    return "Finished with no errors.";
}

void TransferScheduler::setState(State state)
{
    if (m_state == state) return;
    qDebug() << "[Scheduler]" << stateName(m_state) << "->" << stateName(state);
    m_state = state;
}

bool TransferScheduler::cancelRequested() const
{
    return m_ctx.cancel && m_ctx.cancel->load();
}

QList<TransferUnit> TransferScheduler::submissionOrder(QList<TransferUnit> units)
{
    std::stable_sort(units.begin(), units.end(), [](const TransferUnit& a, const TransferUnit& b) {
        return !a.needsTranscode() && b.needsTranscode();
    });
    return units;
}

void TransferScheduler::prepareDirectories(const QList<TransferUnit>& units)
{
    QSet<QString> dirs;
    for (const TransferUnit& u : units) dirs.insert(QFileInfo(u.destination()).absolutePath());
    QStringList sorted(dirs.cbegin(), dirs.cend());
    std::sort(sorted.begin(), sorted.end());
    for (const QString& d : sorted) {
        if (FileUtils::dirExists(d)) continue;
        qDebug() << "[Scheduler] Creating directory" << d;
        if (!QDir().mkpath(d)) {
            qWarning() << "[Scheduler] Could not create directory" << d;
        }
    }
}

// Final transfer of one unit. Returns false if the run was interrupted.
bool TransferScheduler::transferOne(TransferUnit& unit, const RunOptions& options, RunReport& report)
{
    const bool staged = unit.isStaged();
    m_lastFile = unit.destination();
    try {
        switch (unit.transfer(m_ctx, options.force, options.dryRun)) {
        case TransferUnit::Action::Transcoded: ++report.transcoded; break;
        case TransferUnit::Action::Copied:
            if (staged) ++report.transcoded; else ++report.copied;
            break;
        case TransferUnit::Action::ChecksumSaved: ++report.checksumsSaved; break;
        case TransferUnit::Action::Skipped: ++report.skipped; break;
        }
    } catch (const CancelledError& e) {
        qDebug() << "[Scheduler]" << e.message();
        return false;
    } catch (const std::exception& e) {
        if (cancelRequested()) {
            qDebug() << "[Scheduler] Transfer of" << unit.source() << "ended by cancel:" << e.what();
            return false;
        }
        qCritical().noquote() << "Exception while transferring" << unit.source() << ":" << e.what();
        report.failedFiles << unit.source();
        if (dynamic_cast<const CopyError*>(&e)) removeIncomplete(m_lastFile);
    }
    m_lastFile.clear();
    return !cancelRequested();
}

void TransferScheduler::removeIncomplete(const QString& path)
{
    if (path.isEmpty() || !FileUtils::fileExists(path)) return;
    qInfo().noquote() << "Cleaning incomplete transfer:" << path;
    if (!QFile::remove(path)) {
        qWarning() << "[Scheduler] Could not remove" << path;
    }
}

bool TransferScheduler::runSequential(QList<TransferUnit>& units, const RunOptions& options, RunReport& report)
{
    qDebug() << "[Scheduler] Running in sequential mode.";
    setState(State::Transferring);
    for (TransferUnit& unit : units) {
        if (cancelRequested()) return false;
        const QString source = unit.source();
        TransferUnit work = unit;
        try {
            work = unit.stageToTempdir(m_ctx, m_workDir, options.force, options.dryRun);
        } catch (const CancelledError& e) {
            qDebug() << "[Scheduler]" << e.message();
            return false;
        } catch (const std::exception& e) {
            if (cancelRequested()) {
                qDebug() << "[Scheduler] Transcode of" << source << "ended by cancel:" << e.what();
                return false;
            }
            qCritical().noquote() << "Exception while transcoding" << source << ":" << e.what();
            report.failedFiles << source;
            continue;
        }
        if (!transferOne(work, options, report)) return false;
    }
    return true;
}

bool TransferScheduler::runParallel(const QList<TransferUnit>& units, const RunOptions& options, RunReport& report)
{
    const int jobs = options.jobs;
    qDebug().noquote() << QString("[Scheduler] Running %1 transcoding %2 and 1 transfer job in parallel.")
                              .arg(jobs).arg(jobs > 1 ? "jobs" : "job");
    setState(State::Transcoding);

    ResultQueue queue;
    QThreadPool pool;
    pool.setMaxThreadCount(jobs);
    // Staged files of units that never reached the transfer loop live in the
    // work directory and go away with it.
    auto drain = qScopeGuard([&pool] { pool.waitForDone(); });

    const QList<TransferUnit> ordered = submissionOrder(units);
    const TransferContext ctx = m_ctx;
    const QString workDir = m_workDir;
    const bool force = options.force;
    QList<QFuture<void>> futures;
    futures.reserve(ordered.size());
    for (const TransferUnit& unit : ordered) {
        futures << QtConcurrent::run(&pool, [&queue, ctx, workDir, force, unit]() {
            if (ctx.cancel && ctx.cancel->load()) {
                queue.push({StageResult::Status::Cancelled, unit, QString()});
                return;
            }
            try {
                queue.push({StageResult::Status::Staged, unit.stageToTempdir(ctx, workDir, force, false), QString()});
            } catch (const CancelledError& e) {
                queue.push({StageResult::Status::Cancelled, unit, e.message()});
            } catch (const std::exception& e) {
                const bool cancelled = ctx.cancel && ctx.cancel->load();
                queue.push({cancelled ? StageResult::Status::Cancelled : StageResult::Status::Failed,
                            unit, QString::fromUtf8(e.what())});
            }
        });
    }

    setState(State::Transferring);
    int remaining = ordered.size();
    while (remaining > 0) {
        if (cancelRequested()) return false;
        std::optional<StageResult> result = queue.pop(kResultPollMs);
        if (!result) continue;
        --remaining;
        switch (result->status) {
        case StageResult::Status::Cancelled:
            return false;
        case StageResult::Status::Failed:
            qCritical().noquote() << "Exception while transcoding" << result->unit.source() << ":" << result->error;
            report.failedFiles << result->unit.source();
            break;
        case StageResult::Status::Staged:
            if (!transferOne(result->unit, options, report)) return false;
            break;
        }
    }
    return true;
}

void TransferScheduler::deleteOrphans(const RunOptions& options, RunReport& report)
{
    const QStringList extra = m_mapper.extraDestinationFiles();
    for (const QString& f : extra) {
        qInfo().noquote() << "Deleting:" << f;
        if (options.dryRun) continue;
        if (!QFile::remove(f)) {
            qWarning() << "[Scheduler] Could not delete" << f;
            report.failedFiles << f;
            continue;
        }
        ++report.deleted;
    }
}

RunReport TransferScheduler::run(const RunOptions& options)
{
    RunReport report;
    m_lastFile.clear();
    m_workDir.clear();
    int jobs = std::max(0, options.jobs);

    if (options.dryRun && jobs > 0) {
        qDebug() << "[Scheduler] Switching to sequential mode because --dry-run was specified.";
        jobs = 0;
    }
    qDebug() << "[Scheduler] Using" << (options.useChecksum ? "checksum tags" : "file modification times")
             << "to determine whether updates are needed.";

    setState(State::Enumerating);
    const QList<TransferUnit> all = m_mapper.enumerateUnits(options.encoderOptions, options.useChecksum);
    qDebug() << "[Scheduler] Found" << all.size() << "source files";

    setState(State::Planning);
    QList<TransferUnit> units;
    units.reserve(all.size());
    bool needAtLeastOneTranscode = false;
    for (const TransferUnit& unit : all) {
        try {
            const bool update = options.force || unit.needsUpdate(m_ctx);
            if (update && unit.needsTranscode()) needAtLeastOneTranscode = true;
            units << unit;
        } catch (const std::exception& e) {
            qCritical().noquote() << "Exception while checking" << unit.source() << ":" << e.what();
            report.failedFiles << unit.source();
        }
    }

    if (needAtLeastOneTranscode) {
        if (options.encoderOptions) {
            qDebug() << "[Scheduler] Using encoder options:" << *options.encoderOptions;
        } else {
            qDebug() << "[Scheduler] Using ffmpeg's default encoder options";
        }
        if (!options.dryRun && (!m_ctx.engine || !m_ctx.engine->isAvailable())) {
            throw ConfigError("Could not run ffmpeg. Check the --ffmpeg option.");
        }
    } else if (jobs > 0) {
        qDebug() << "[Scheduler] Switching to sequential mode because no transcodes are required.";
        jobs = 0;
    }

    const QString tempParent = options.tempDir.isEmpty() ? QDir::tempPath() : options.tempDir;
    QTemporaryDir work(QDir(tempParent).filePath("mirrorcoder_XXXXXX"));
    if (!work.isValid()) {
        throw ConfigError(QString("Could not create a work directory in %1: %2").arg(tempParent, work.errorString()));
    }
    m_workDir = work.path();
    qDebug() << "[Scheduler] Work directory:" << m_workDir;

    bool completed = true;
    {
        auto cleanup = qScopeGuard([this, &work] {
            setState(State::Cleanup);
            removeIncomplete(m_lastFile);
            m_lastFile.clear();
            qDebug() << "[Scheduler] Deleting temporary directory";
            if (!work.remove()) {
                qDebug() << "[Scheduler] Temporary directory was already gone or could not be removed";
            }
        });

        if (cancelRequested()) {
            completed = false;
        } else if (!options.dryRun) {
            prepareDirectories(units);
        }

        if (!completed) {
            qDebug() << "[Scheduler] Cancelled before the transfer phase";
        } else if (jobs == 0) {
            completed = runSequential(units, options, report);
        } else {
            completed = runParallel(units, options, report);
        }
    }

    if (!completed || cancelRequested()) {
        qCritical() << "Canceled.";
        setState(State::Interrupted);
        report.outcome = RunReport::Outcome::Interrupted;
        return report;
    }

    if (options.deleteOrphans) {
        deleteOrphans(options, report);
    }

    report.outcome = report.failedFiles.isEmpty() ? RunReport::Outcome::Success : RunReport::Outcome::Failures;
    setState(State::Done);
    return report;
}
