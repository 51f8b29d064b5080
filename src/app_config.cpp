#include "app_config.h"
#include "encoder_presets.h"
#include "errors.h"
#include "file_utils.h"

#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QThread>

#include <memory>

namespace {

// INI values containing commas come back as string lists.
QString iniString(const QSettings& settings, const QString& key)
{
    const QVariant v = settings.value(key);
    if (v.typeId() == QMetaType::QStringList) return v.toStringList().join(',');
    return v.toString();
}

QString pick(const QCommandLineParser& parser, const QString& name, const QSettings* ini, const QString& fallback)
{
    if (parser.isSet(name)) return parser.value(name);
    const QString key = "defaults/" + name;
    if (ini && ini->contains(key)) return iniString(*ini, key);
    return fallback;
}

bool pickFlag(const QCommandLineParser& parser, const QString& name, const QSettings* ini)
{
    if (parser.isSet(name)) return true;
    const QString key = "defaults/" + name;
    return ini && ini->value(key, false).toBool();
}

} // namespace

void AppConfig::setupParser(QCommandLineParser& parser)
{
    parser.setApplicationDescription(
        "Mirror a directory with transcoding.\n\n"
        "Everything in the source directory is copied to the destination, except that files of the\n"
        "transcode formats are transcoded into the target format using ffmpeg.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("source-directory", "The directory with all your music in it.");
    parser.addPositionalArgument("destination-directory", "The directory where output files will go.");

    parser.addOptions({
        {{"i", "transcode-formats"}, "Comma-separated list of extensions to transcode.", "list", defaultTranscodeFormats()},
        {{"o", "target-format"}, "Extension of the transcoded files.", "ext", "ogg"},
        {{"p", "ffmpeg"}, "Path to the ffmpeg executable.", "path", "ffmpeg"},
        {{"E", "encoder-options"}, "Extra encoder options passed to ffmpeg.", "opts"},
        {{"r", "rsync"}, "Path to rsync. Pass an empty value to disable it.", "path", "rsync"},
        {{"n", "dry-run"}, "Don't actually modify anything."},
        {{"z", "include-hidden"}, "Don't skip directories and files starting with a dot."},
        {{"D", "delete"}, "Delete files in the destination that do not have a corresponding file in the source directory."},
        {{"f", "force"}, "Update destination files even if they are newer."},
        {{"k", "no-checksum-tags"}, "Don't save a checksum of the source file in the destination file; use modification times."},
        {{"t", "temp-dir"}, "Temporary directory to use for transcoded files.", "dir", QDir::tempPath()},
        {{"j", "jobs"}, "Number of transcoding jobs to run in parallel. 0 runs everything sequentially.", "n",
         QString::number(QThread::idealThreadCount())},
        {{"q", "quiet"}, "Do not print informational messages."},
        {{"v", "verbose"}, "Print debug messages."},
        {{"c", "config"}, "INI file with [defaults] and [presets] sections.", "file"},
        {{"l", "log-file"}, "Also append the log to this file.", "file"},
    });
}

QSet<QString> AppConfig::parseFormatList(const QString& list)
{
    QSet<QString> out;
    const QStringList parts = list.split(',', Qt::SkipEmptyParts);
    for (const QString& p : parts) {
        const QString f = p.trimmed().toLower();
        if (!f.isEmpty()) out.insert(f);
    }
    return out;
}

AppConfig AppConfig::fromParser(const QCommandLineParser& parser)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 2) {
        throw ConfigError("Expected a source and a destination directory");
    }

    std::unique_ptr<QSettings> ini;
    if (parser.isSet("config")) {
        const QString path = parser.value("config");
        if (!FileUtils::fileExists(path)) {
            throw ConfigError(QString("Configuration file does not exist: %1").arg(path));
        }
        ini = std::make_unique<QSettings>(path, QSettings::IniFormat);
        if (ini->status() != QSettings::NoError) {
            throw ConfigError(QString("Could not parse configuration file: %1").arg(path));
        }
    }
    const QSettings* s = ini.get();

    AppConfig cfg;
    cfg.sourceDir = positional.at(0);
    cfg.destinationDir = positional.at(1);
    cfg.transcodeFormats = parseFormatList(pick(parser, "transcode-formats", s, defaultTranscodeFormats()));
    cfg.targetFormat = pick(parser, "target-format", s, "ogg").trimmed().toLower();
    if (cfg.targetFormat.startsWith('.')) cfg.targetFormat.remove(0, 1);
    cfg.ffmpegPath = pick(parser, "ffmpeg", s, "ffmpeg");
    cfg.rsyncPath = pick(parser, "rsync", s, "rsync");
    cfg.tempDir = pick(parser, "temp-dir", s, QDir::tempPath());
    cfg.logFile = parser.value("log-file");

    if (parser.isSet("encoder-options") || (s && s->contains("defaults/encoder-options"))) {
        cfg.encoderOptions = pick(parser, "encoder-options", s, QString());
    }
    if (s) {
        QSettings& group = *ini;
        group.beginGroup("presets");
        const QStringList keys = group.childKeys();
        for (const QString& k : keys) cfg.presets.insert(k.toLower(), iniString(group, k));
        group.endGroup();
    }

    cfg.dryRun = parser.isSet("dry-run");
    cfg.includeHidden = pickFlag(parser, "include-hidden", s);
    cfg.deleteOrphans = pickFlag(parser, "delete", s);
    cfg.force = parser.isSet("force");
    cfg.useChecksum = !pickFlag(parser, "no-checksum-tags", s);

    bool ok = false;
    const QString jobsText = pick(parser, "jobs", s, QString::number(QThread::idealThreadCount()));
    cfg.jobs = jobsText.trimmed().toInt(&ok);
    if (!ok || cfg.jobs < 0) {
        throw ConfigError(QString("Invalid job count: %1").arg(jobsText));
    }

    if (parser.isSet("quiet") && parser.isSet("verbose")) {
        throw ConfigError("--quiet and --verbose are mutually exclusive");
    }
    if (parser.isSet("quiet")) cfg.verbosity = LogManager::Verbosity::Quiet;
    if (parser.isSet("verbose")) cfg.verbosity = LogManager::Verbosity::Verbose;

    cfg.validate();
    return cfg;
}

void AppConfig::validate() const
{
    if (!FileUtils::dirExists(sourceDir)) {
        throw ConfigError(QString("Source directory does not exist: %1").arg(sourceDir));
    }
    if (FileUtils::pathExists(destinationDir) && !FileUtils::dirExists(destinationDir)) {
        throw ConfigError(QString("Destination exists and is not a directory: %1").arg(destinationDir));
    }
    if (transcodeFormats.isEmpty()) {
        throw ConfigError("No transcode formats given");
    }
    if (targetFormat.isEmpty()) {
        throw ConfigError("No target format given");
    }
    if (transcodeFormats.contains(targetFormat)) {
        throw ConfigError("The target format must not be one of the transcode formats");
    }
    if (jobs < 0) {
        throw ConfigError(QString("Invalid job count: %1").arg(jobs));
    }
    if (!FileUtils::dirExists(tempDir)) {
        throw ConfigError(QString("Temporary directory does not exist: %1").arg(tempDir));
    }
}

std::optional<QString> AppConfig::effectiveEncoderOptions() const
{
    return EncoderPresets::resolve(targetFormat, encoderOptions, presets);
}

RunOptions AppConfig::toRunOptions() const
{
    RunOptions o;
    o.force = force;
    o.dryRun = dryRun;
    o.deleteOrphans = deleteOrphans;
    o.useChecksum = useChecksum;
    o.jobs = jobs;
    o.tempDir = tempDir;
    o.encoderOptions = effectiveEncoderOptions();
    return o;
}
