#include <QtTest>
#include <QTemporaryDir>
#include <QDateTime>
#include <QDir>

#include "fake_media.h"
#include "../src/errors.h"
#include "../src/tag_store.h"
#include "../src/transfer_unit.h"

class TestTransferUnit : public QObject {
    Q_OBJECT
private slots:
    void init();
    void testNeedsTranscodeFromExtensions();
    void testChecksumLength();
    void testMissingDestinationNeedsUpdate();
    void testTranscodeWritesTagsAndChecksum();
    void testSourceChangeFlipsStaleness();
    void testEncoderOptionChangeFlipsStaleness();
    void testMtimeFallbackWithoutChecksumTag();
    void testChecksumRepairWithoutRetranscode();
    void testCopyOnlyUsesModificationTime();
    void testStagingLeavesNoTempFiles();
    void testStagedUnitRemovesSourceOnFailure();
    void testDryRunHasNoSideEffects();
    void testCheckReportsMissingPaths();
    void testUnidentifiedSourceFailsBeforeEngine();
    void testMissingOutputIsAnError();
    void testMissingStagedOutputIsAnError();

private:
    TransferContext context();
    QString src(const QString& name) const { return m_src->filePath(name); }
    QString dest(const QString& name) const { return m_dest->filePath(name); }

    std::unique_ptr<QTemporaryDir> m_src;
    std::unique_ptr<QTemporaryDir> m_dest;
    std::unique_ptr<QTemporaryDir> m_tmp;
    std::unique_ptr<FakeEngine> m_engine;
    FakeTagBackend m_tags;
    std::atomic_bool m_cancel{false};
};

void TestTransferUnit::init()
{
    m_src = std::make_unique<QTemporaryDir>();
    m_dest = std::make_unique<QTemporaryDir>();
    m_tmp = std::make_unique<QTemporaryDir>();
    m_engine = std::make_unique<FakeEngine>();
    m_cancel = false;
    QVERIFY(m_src->isValid() && m_dest->isValid() && m_tmp->isValid());
}

TransferContext TestTransferUnit::context()
{
    TransferContext ctx;
    ctx.engine = m_engine.get();
    ctx.tags = &m_tags;
    ctx.cancel = &m_cancel;
    return ctx;
}

void TestTransferUnit::testNeedsTranscodeFromExtensions()
{
    QVERIFY(TransferUnit(src("a.flac"), dest("a.ogg")).needsTranscode());
    QVERIFY(!TransferUnit(src("a.mp3"), dest("a.mp3")).needsTranscode());
    QVERIFY(!TransferUnit(src("a.MP3"), dest("a.mp3")).needsTranscode());
}

void TestTransferUnit::testChecksumLength()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "pcm"));
    const QString sum = TransferUnit::computeChecksum(src("a.flac"), std::nullopt);
    QCOMPARE(sum.size(), 32);
    QCOMPARE(sum, TransferUnit::computeChecksum(src("a.flac"), QString()));
    QVERIFY(sum != TransferUnit::computeChecksum(src("a.flac"), QString("-q:a 5")));
    QVERIFY_EXCEPTION_THROWN(TransferUnit::computeChecksum(src("missing.flac"), std::nullopt), MissingInputError);
}

void TestTransferUnit::testMissingDestinationNeedsUpdate()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "pcm"));
    const TransferContext ctx = context();
    QVERIFY(TransferUnit(src("a.flac"), dest("a.ogg")).needsUpdate(ctx));
}

void TestTransferUnit::testTranscodeWritesTagsAndChecksum()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {{"title", "Song"}}, "pcm"));
    QVERIFY(QFile::setPermissions(src("a.flac"), QFile::ReadOwner | QFile::WriteOwner | QFile::ReadGroup));
    const TransferContext ctx = context();
    TransferUnit unit(src("a.flac"), dest("a.ogg"), QString("-q:a 5"), true);

    QCOMPARE(unit.transfer(ctx, false, false), TransferUnit::Action::Transcoded);
    QCOMPARE(m_engine->transcodeCount(), 1);

    const auto tags = FakeMedia::tags(dest("a.ogg"));
    QCOMPARE(tags.value("title"), QString("Song"));
    QVERIFY(!tags.contains("replaygain_track_gain"));
    QCOMPARE(tags.value(TagTools::kChecksumKey), unit.sourceChecksum());
    QCOMPARE(FakeMedia::payload(dest("a.ogg")), QByteArray("transcoded[-q:a 5]:pcm"));
    QCOMPARE(QFile::permissions(dest("a.ogg")), QFile::permissions(src("a.flac")));

    TransferUnit again(src("a.flac"), dest("a.ogg"), QString("-q:a 5"), true);
    QVERIFY(!again.needsUpdate(ctx));
    QCOMPARE(again.transfer(ctx, false, false), TransferUnit::Action::Skipped);
    QCOMPARE(m_engine->transcodeCount(), 1);
}

void TestTransferUnit::testSourceChangeFlipsStaleness()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "pcm"));
    const TransferContext ctx = context();
    TransferUnit(src("a.flac"), dest("a.ogg")).transfer(ctx, false, false);
    QVERIFY(!TransferUnit(src("a.flac"), dest("a.ogg")).needsUpdate(ctx));

    QVERIFY(FakeMedia::write(src("a.flac"), {}, "pcm2"));
    // Keep the source older so only the checksum can tell.
    QVERIFY(FakeMedia::setModified(src("a.flac"), QDateTime::currentDateTime().addDays(-1)));
    QVERIFY(TransferUnit(src("a.flac"), dest("a.ogg")).needsUpdate(ctx));
}

void TestTransferUnit::testEncoderOptionChangeFlipsStaleness()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "pcm"));
    const TransferContext ctx = context();
    TransferUnit(src("a.flac"), dest("a.ogg"), QString("-q:a 5")).transfer(ctx, false, false);
    QVERIFY(!TransferUnit(src("a.flac"), dest("a.ogg"), QString("-q:a 5")).needsUpdate(ctx));
    QVERIFY(TransferUnit(src("a.flac"), dest("a.ogg"), QString("-q:a 7")).needsUpdate(ctx));
}

void TestTransferUnit::testMtimeFallbackWithoutChecksumTag()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "pcm"));
    QVERIFY(FakeMedia::write(dest("a.ogg"), {}, "legacy"));
    const TransferContext ctx = context();
    const QDateTime now = QDateTime::currentDateTime();

    QVERIFY(FakeMedia::setModified(src("a.flac"), now.addSecs(-3600)));
    QVERIFY(FakeMedia::setModified(dest("a.ogg"), now));
    QVERIFY(!TransferUnit(src("a.flac"), dest("a.ogg")).needsUpdate(ctx));

    QVERIFY(FakeMedia::setModified(dest("a.ogg"), now.addSecs(-7200)));
    QVERIFY(TransferUnit(src("a.flac"), dest("a.ogg")).needsUpdate(ctx));
}

void TestTransferUnit::testChecksumRepairWithoutRetranscode()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "pcm"));
    QVERIFY(FakeMedia::write(dest("a.ogg"), {{"title", "legacy"}}, "legacy"));
    const QDateTime now = QDateTime::currentDateTime();
    QVERIFY(FakeMedia::setModified(src("a.flac"), now.addSecs(-3600)));
    QVERIFY(FakeMedia::setModified(dest("a.ogg"), now));
    const TransferContext ctx = context();

    TransferUnit unit(src("a.flac"), dest("a.ogg"));
    QCOMPARE(unit.transfer(ctx, false, false), TransferUnit::Action::ChecksumSaved);
    QCOMPARE(m_engine->transcodeCount(), 0);
    QCOMPARE(FakeMedia::payload(dest("a.ogg")), QByteArray("legacy"));
    QCOMPARE(FakeMedia::tags(dest("a.ogg")).value(TagTools::kChecksumKey), unit.sourceChecksum());
    QVERIFY(unit.checksumCurrent(ctx));
}

void TestTransferUnit::testCopyOnlyUsesModificationTime()
{
    QFile f(src("b.mp3"));
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("mp3 bytes");
    f.close();
    const TransferContext ctx = context();

    TransferUnit unit(src("b.mp3"), dest("b.mp3"));
    QCOMPARE(unit.transfer(ctx, false, false), TransferUnit::Action::Copied);
    QFile out(dest("b.mp3"));
    QVERIFY(out.open(QIODevice::ReadOnly));
    QCOMPARE(out.readAll(), QByteArray("mp3 bytes"));
    QVERIFY(!FakeMedia::tags(dest("b.mp3")).contains(TagTools::kChecksumKey));

    QVERIFY(FakeMedia::setModified(src("b.mp3"), QDateTime::currentDateTime().addSecs(-60)));
    QCOMPARE(TransferUnit(src("b.mp3"), dest("b.mp3")).transfer(ctx, false, false), TransferUnit::Action::Skipped);
}

void TestTransferUnit::testStagingLeavesNoTempFiles()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {{"title", "Song"}}, "pcm"));
    const TransferContext ctx = context();
    TransferUnit unit(src("a.flac"), dest("a.ogg"));

    TransferUnit staged = unit.stageToTempdir(ctx, m_tmp->path(), false, false);
    QVERIFY(staged.isStaged());
    QVERIFY(QFileInfo(staged.source()).fileName().startsWith("a_"));
    QVERIFY(staged.source().endsWith(".ogg"));
    QVERIFY(QFile::exists(staged.source()));
    QVERIFY(!QFile::exists(dest("a.ogg")));
    QVERIFY(staged.needsUpdate(ctx));

    QCOMPARE(staged.transfer(ctx, false, false), TransferUnit::Action::Copied);
    QVERIFY(QFile::exists(dest("a.ogg")));
    QVERIFY(!QFile::exists(staged.source()));
    QVERIFY(QDir(m_tmp->path()).entryList(QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot).isEmpty());
    QCOMPARE(FakeMedia::tags(dest("a.ogg")).value(TagTools::kChecksumKey), unit.sourceChecksum());

    // Direct transfer with a temp dir goes through the same staging.
    QVERIFY(QFile::remove(dest("a.ogg")));
    TransferUnit direct(src("a.flac"), dest("a.ogg"));
    QCOMPARE(direct.transfer(ctx, false, false, m_tmp->path()), TransferUnit::Action::Transcoded);
    QVERIFY(QFile::exists(dest("a.ogg")));
    QVERIFY(QDir(m_tmp->path()).entryList(QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot).isEmpty());
}

void TestTransferUnit::testStagedUnitRemovesSourceOnFailure()
{
    const QString temp = m_tmp->filePath("a_XYZ.ogg");
    QVERIFY(FakeMedia::write(temp, {}, "ogg"));
    TransferUnit staged = TransferUnit::staged(temp, m_dest->filePath("missing-dir/a.ogg"));
    const TransferContext ctx = context();
    QVERIFY_EXCEPTION_THROWN(staged.transfer(ctx, false, false), MissingOutputDirError);
    QVERIFY(!QFile::exists(temp));
}

void TestTransferUnit::testDryRunHasNoSideEffects()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "pcm"));
    const TransferContext ctx = context();
    TransferUnit unit(src("a.flac"), dest("a.ogg"));

    TransferUnit same = unit.stageToTempdir(ctx, m_tmp->path(), false, true);
    QVERIFY(!same.isStaged());
    QCOMPARE(unit.transfer(ctx, false, true, m_tmp->path()), TransferUnit::Action::Transcoded);
    QCOMPARE(m_engine->transcodeCount(), 0);
    QVERIFY(!QFile::exists(dest("a.ogg")));
    QVERIFY(QDir(m_tmp->path()).isEmpty());
}

void TestTransferUnit::testCheckReportsMissingPaths()
{
    QVERIFY_EXCEPTION_THROWN(TransferUnit(src("none.flac"), dest("none.ogg")).check(), MissingInputError);
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "pcm"));
    QVERIFY_EXCEPTION_THROWN(TransferUnit(src("a.flac"), dest("no/such/dir/a.ogg")).check(), MissingOutputDirError);
    TransferUnit(src("a.flac"), dest("a.ogg")).check();
}

void TestTransferUnit::testUnidentifiedSourceFailsBeforeEngine()
{
    QFile f(src("fake.flac"));
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("not audio");
    f.close();
    const TransferContext ctx = context();
    QVERIFY_EXCEPTION_THROWN(TransferUnit(src("fake.flac"), dest("fake.ogg")).transfer(ctx, false, false),
                             TranscodeError);
    QCOMPARE(m_engine->transcodeCount(), 0);
}

void TestTransferUnit::testMissingOutputIsAnError()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "NOOUTPUT"));
    const TransferContext ctx = context();
    QVERIFY_EXCEPTION_THROWN(TransferUnit(src("a.flac"), dest("a.ogg")).transfer(ctx, false, false), TranscodeError);
    QCOMPARE(m_engine->transcodeCount(), 1);
    QVERIFY(!QFile::exists(dest("a.ogg")));
}

void TestTransferUnit::testMissingStagedOutputIsAnError()
{
    QVERIFY(FakeMedia::write(src("a.flac"), {}, "NOOUTPUT"));
    const TransferContext ctx = context();
    TransferUnit unit(src("a.flac"), dest("a.ogg"));
    QVERIFY_EXCEPTION_THROWN(unit.stageToTempdir(ctx, m_tmp->path(), false, false), TranscodeError);
    QCOMPARE(m_engine->transcodeCount(), 1);
    QVERIFY(QDir(m_tmp->path()).isEmpty());

    QVERIFY_EXCEPTION_THROWN(unit.transfer(ctx, false, false, m_tmp->path()), TranscodeError);
    QVERIFY(!QFile::exists(dest("a.ogg")));
    QVERIFY(QDir(m_tmp->path()).isEmpty());
}

QTEST_APPLESS_MAIN(TestTransferUnit)
#include "test_transfer_unit.moc"
