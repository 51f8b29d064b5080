#pragma once
#include "transfer_unit.h"

#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

class PathMapper;

struct RunOptions {
    bool force = false;
    bool dryRun = false;
    bool deleteOrphans = false;
    bool useChecksum = true;
    int jobs = 0;                          // 0: transcode and transfer in one sequential loop
    QString tempDir;                       // parent of the per-run work directory
    std::optional<QString> encoderOptions; // already resolved for the target format
};

struct RunReport {
    enum class Outcome { Success, Failures, Interrupted };

    Outcome outcome = Outcome::Success;
    QStringList failedFiles;
    int transcoded = 0;
    int copied = 0;
    int skipped = 0;
    int checksumsSaved = 0;
    int deleted = 0;
};

// Runs one mirror pass: plans every unit, transcodes in parallel into a private
// work directory, and moves results into the destination tree one at a time.
// Per-file failures are collected; only configuration problems throw.
class TransferScheduler {
public:
    enum class State { Idle, Enumerating, Planning, Transcoding, Transferring, Cleanup, Done, Interrupted };

    TransferScheduler(const PathMapper& mapper, const TransferContext& ctx);

    // Throws ConfigError if the run cannot start.
    RunReport run(const RunOptions& options);

    State state() const { return m_state; }

    // Work directory of the current or last run.
    QString workDir() const { return m_workDir; }

    // Copy-only units first, input order otherwise.
    static QList<TransferUnit> submissionOrder(QList<TransferUnit> units);

    static QString stateName(State state);

    // Closing line of the end-of-run summary.
    static QString summaryBanner(const RunReport& report);

private:
    struct StageResult;
    class ResultQueue;

    void setState(State state);
    bool cancelRequested() const;
    void prepareDirectories(const QList<TransferUnit>& units);
    void removeIncomplete(const QString& path);
    bool transferOne(TransferUnit& unit, const RunOptions& options, RunReport& report);
    bool runSequential(QList<TransferUnit>& units, const RunOptions& options, RunReport& report);
    bool runParallel(const QList<TransferUnit>& units, const RunOptions& options, RunReport& report);
    void deleteOrphans(const RunOptions& options, RunReport& report);

    const PathMapper& m_mapper;
    TransferContext m_ctx;
    State m_state = State::Idle;
    QString m_workDir;
    QString m_lastFile;
};
