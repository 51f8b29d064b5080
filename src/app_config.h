#pragma once
#include "log_manager.h"
#include "transfer_scheduler.h"

#include <QMap>
#include <QSet>
#include <QString>
#include <optional>

class QCommandLineParser;
class QSettings;

// Effective settings of one run, merged from the command line and an optional
// INI file. Command-line values always win over the file.
struct AppConfig {
    QString sourceDir;
    QString destinationDir;
    QSet<QString> transcodeFormats;
    QString targetFormat = "ogg";
    QString ffmpegPath = "ffmpeg";
    std::optional<QString> encoderOptions;  // explicit -E / [defaults] value
    QMap<QString, QString> presets;         // [presets] section
    QString rsyncPath = "rsync";
    bool dryRun = false;
    bool includeHidden = false;
    bool deleteOrphans = false;
    bool force = false;
    bool useChecksum = true;
    QString tempDir;
    int jobs = 0;
    LogManager::Verbosity verbosity = LogManager::Verbosity::Normal;
    QString logFile;

    static QString defaultTranscodeFormats() { return QStringLiteral("flac,wv,wav,ape,fla"); }

    // Registers every option and the two positional arguments.
    static void setupParser(QCommandLineParser& parser);

    // Builds and validates the configuration. Throws ConfigError.
    static AppConfig fromParser(const QCommandLineParser& parser);

    // Comma-separated list; blanks and empty items dropped, lower-cased.
    static QSet<QString> parseFormatList(const QString& list);

    // Throws ConfigError on the first problem found.
    void validate() const;

    // Encoder options for the target format after preset lookup.
    std::optional<QString> effectiveEncoderOptions() const;

    RunOptions toRunOptions() const;
};
