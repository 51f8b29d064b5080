#include <QtTest>
#include <QCommandLineParser>
#include <QTemporaryDir>
#include <QThread>

#include "../src/app_config.h"
#include "../src/errors.h"

class TestAppConfig : public QObject {
    Q_OBJECT
private slots:
    void init();
    void testParseFormatList();
    void testDefaults();
    void testCommandLineOptions();
    void testConfigFileDefaultsAndPresets();
    void testCommandLineWinsOverConfigFile();
    void testValidationErrors();
    void testValidationErrors_data();

private:
    AppConfig parse(QStringList args);
    QString writeIni(const QByteArray& text);

    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_src;
    QString m_dest;
};

void TestAppConfig::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_src = m_dir->filePath("src");
    m_dest = m_dir->filePath("dest");
    QVERIFY(QDir().mkpath(m_src));
}

AppConfig TestAppConfig::parse(QStringList args)
{
    QCommandLineParser parser;
    AppConfig::setupParser(parser);
    args.prepend("mirrorcoder");
    if (!parser.parse(args)) throw ConfigError(parser.errorText());
    return AppConfig::fromParser(parser);
}

QString TestAppConfig::writeIni(const QByteArray& text)
{
    const QString path = m_dir->filePath("mirrorcoder.ini");
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return QString();
    f.write(text);
    return path;
}

void TestAppConfig::testParseFormatList()
{
    QCOMPARE(AppConfig::parseFormatList(" FLAC, wv,,wav , "), QSet<QString>({"flac", "wv", "wav"}));
    QVERIFY(AppConfig::parseFormatList(" , ").isEmpty());
}

void TestAppConfig::testDefaults()
{
    const AppConfig cfg = parse({m_src, m_dest});
    QCOMPARE(cfg.transcodeFormats, QSet<QString>({"flac", "wv", "wav", "ape", "fla"}));
    QCOMPARE(cfg.targetFormat, QString("ogg"));
    QCOMPARE(cfg.ffmpegPath, QString("ffmpeg"));
    QCOMPARE(cfg.rsyncPath, QString("rsync"));
    QCOMPARE(cfg.jobs, QThread::idealThreadCount());
    QVERIFY(cfg.useChecksum);
    QVERIFY(!cfg.encoderOptions.has_value());
    QCOMPARE(cfg.effectiveEncoderOptions(), std::optional<QString>(QString("-codec:a libvorbis -q:a 5")));
    QCOMPARE(cfg.verbosity, LogManager::Verbosity::Normal);
}

void TestAppConfig::testCommandLineOptions()
{
    const AppConfig cfg = parse({"-i", "flac,wav", "-o", "mp3", "-j", "0", "-n", "-D", "-k", "-z", "-f", "-v",
                                 "--encoder-options=-q:a 0", "-r", "", m_src, m_dest});
    QCOMPARE(cfg.targetFormat, QString("mp3"));
    QCOMPARE(cfg.jobs, 0);
    QVERIFY(cfg.dryRun && cfg.deleteOrphans && cfg.includeHidden && cfg.force);
    QVERIFY(!cfg.useChecksum);
    QVERIFY(cfg.rsyncPath.isEmpty());
    QCOMPARE(cfg.verbosity, LogManager::Verbosity::Verbose);

    const RunOptions o = cfg.toRunOptions();
    QCOMPARE(o.encoderOptions, std::optional<QString>(QString("-q:a 0")));
    QVERIFY(o.dryRun && o.deleteOrphans && o.force && !o.useChecksum);
}

void TestAppConfig::testConfigFileDefaultsAndPresets()
{
    const QString ini = writeIni("[defaults]\n"
                                 "target-format=opus\n"
                                 "transcode-formats=\"flac,wav\"\n"
                                 "jobs=3\n"
                                 "delete=true\n"
                                 "[presets]\n"
                                 "opus=-codec:a libopus -b:a 96k\n");
    const AppConfig cfg = parse({"-c", ini, m_src, m_dest});
    QCOMPARE(cfg.targetFormat, QString("opus"));
    QCOMPARE(cfg.transcodeFormats, QSet<QString>({"flac", "wav"}));
    QCOMPARE(cfg.jobs, 3);
    QVERIFY(cfg.deleteOrphans);
    QCOMPARE(cfg.effectiveEncoderOptions(), std::optional<QString>(QString("-codec:a libopus -b:a 96k")));
}

void TestAppConfig::testCommandLineWinsOverConfigFile()
{
    const QString ini = writeIni("[defaults]\ntarget-format=opus\njobs=3\n");
    const AppConfig cfg = parse({"-c", ini, "-o", "mp3", "-j", "1", m_src, m_dest});
    QCOMPARE(cfg.targetFormat, QString("mp3"));
    QCOMPARE(cfg.jobs, 1);
}

void TestAppConfig::testValidationErrors_data()
{
    QTest::addColumn<QStringList>("extra");
    QTest::addColumn<bool>("missingSource");

    QTest::newRow("target in transcode set") << QStringList({"-i", "flac,ogg"}) << false;
    QTest::newRow("empty transcode set") << QStringList({"-i", " , "}) << false;
    QTest::newRow("negative jobs") << QStringList({"--jobs=-1"}) << false;
    QTest::newRow("non-numeric jobs") << QStringList({"-j", "many"}) << false;
    QTest::newRow("missing temp dir") << QStringList({"-t", "/no/such/temp/dir"}) << false;
    QTest::newRow("quiet and verbose") << QStringList({"-q", "-v"}) << false;
    QTest::newRow("missing config") << QStringList({"-c", "/no/such/file.ini"}) << false;
    QTest::newRow("missing source") << QStringList() << true;
}

void TestAppConfig::testValidationErrors()
{
    QFETCH(QStringList, extra);
    QFETCH(bool, missingSource);
    QStringList args = extra;
    args << (missingSource ? m_dir->filePath("nope") : m_src) << m_dest;
    QVERIFY_EXCEPTION_THROWN(parse(args), ConfigError);
}

QTEST_GUILESS_MAIN(TestAppConfig)
#include "test_app_config.moc"
