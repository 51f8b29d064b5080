#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QDebug>

#include "app_config.h"
#include "errors.h"
#include "ffmpeg_tag_backend.h"
#include "interrupt.h"
#include "log_manager.h"
#include "path_mapper.h"
#include "transcode_engine.h"
#include "transfer_scheduler.h"

extern "C" {
#include <libavutil/log.h>
}

namespace {
constexpr int kExitSuccess = 0;
constexpr int kExitFailures = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitInterrupted = 130;

void printSummary(const RunReport& report, bool dryRun)
{
    qDebug() << "[MAIN] transcoded" << report.transcoded << "copied" << report.copied << "skipped" << report.skipped
             << "checksums saved" << report.checksumsSaved << "deleted" << report.deleted;
    if (!report.failedFiles.isEmpty()) {
        QStringList lines;
        for (const QString& f : report.failedFiles) lines << "\t" + f;
        qCritical().noquote() << QString("%1 files were not processed successfully:\n%2")
                                     .arg(report.failedFiles.size())
                                     .arg(lines.join('\n'));
    }
    qInfo().noquote() << TransferScheduler::summaryBanner(report);
    if (dryRun) {
        qInfo() << "Ran in --dry-run mode. Nothing actually happened.";
    }
}
}

int main(int argc, char *argv[])
{
    // Probing must not spam the console
    av_log_set_level(AV_LOG_ERROR);

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("mirrorcoder");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    AppConfig::setupParser(parser);
    if (!parser.parse(app.arguments())) {
        LogManager::instance().install(LogManager::Verbosity::Normal);
        qCritical().noquote() << parser.errorText();
        return kExitConfigError;
    }
    if (parser.isSet("help")) parser.showHelp(kExitSuccess);
    if (parser.isSet("version")) parser.showVersion();

    AppConfig config;
    try {
        config = AppConfig::fromParser(parser);
    } catch (const ConfigError& e) {
        LogManager::instance().install(LogManager::Verbosity::Normal);
        qCritical().noquote() << e.message();
        return kExitConfigError;
    }

    LogManager& log = LogManager::instance();
    log.install(config.verbosity);
    if (!config.logFile.isEmpty() && !log.setLogFile(config.logFile)) {
        qCritical().noquote() << "Could not open log file" << config.logFile;
        return kExitConfigError;
    }
    if (config.dryRun) {
        qInfo() << "Running in --dry-run mode. Nothing actually happens.";
        log.setDryRun(true);
    }

    if (!Interrupt::install()) {
        qWarning() << "[MAIN] Could not install signal handlers";
    }

    if (!config.dryRun && !QDir().mkpath(config.destinationDir)) {
        qCritical().noquote() << "Could not create destination directory" << config.destinationDir;
        return kExitConfigError;
    }

    FfmpegEngine engine(config.ffmpegPath);
    FfmpegTagBackend tags(config.ffmpegPath);
    TransferContext ctx;
    ctx.engine = &engine;
    ctx.tags = &tags;
    ctx.rsyncPath = config.rsyncPath;
    ctx.cancel = &Interrupt::cancelFlag();

    PathMapper mapper(config.sourceDir, config.destinationDir, config.transcodeFormats, config.targetFormat,
                      config.includeHidden);
    TransferScheduler scheduler(mapper, ctx);

    RunReport report;
    try {
        report = scheduler.run(config.toRunOptions());
    } catch (const ConfigError& e) {
        qCritical().noquote() << e.message();
        return kExitConfigError;
    }

    printSummary(report, config.dryRun);
    switch (report.outcome) {
    case RunReport::Outcome::Success: return kExitSuccess;
    case RunReport::Outcome::Failures: return kExitFailures;
    case RunReport::Outcome::Interrupted: return kExitInterrupted;
    }
    return kExitFailures;
}
