#include <QtTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>

#include "../src/tree_walker.h"

class TestTreeWalker : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void testSkipsHiddenEntries();
    void testIncludeHidden();
    void testEveryCallIsAFreshTraversal();
    void testMissingRootIsEmpty();

private:
    void touch(const QString& rel);
    QStringList relative(const QStringList& files) const;

    QTemporaryDir m_dir;
};

void TestTreeWalker::touch(const QString& rel)
{
    const QString path = m_dir.filePath(rel);
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("x");
}

QStringList TestTreeWalker::relative(const QStringList& files) const
{
    QStringList out;
    QDir root(m_dir.path());
    for (const QString& f : files) out << root.relativeFilePath(f);
    out.sort();
    return out;
}

void TestTreeWalker::initTestCase()
{
    QVERIFY(m_dir.isValid());
    touch("a.flac");
    touch("sub/b.mp3");
    touch(".hidden.flac");
    touch(".git/config");
    touch("sub/.cache/c.wav");
}

void TestTreeWalker::testSkipsHiddenEntries()
{
    const QStringList files = relative(TreeWalker::walkFiles(m_dir.path(), false));
    QCOMPARE(files, QStringList({"a.flac", "sub/b.mp3"}));
}

void TestTreeWalker::testIncludeHidden()
{
    const QStringList files = relative(TreeWalker::walkFiles(m_dir.path(), true));
    QCOMPARE(files, QStringList({".git/config", ".hidden.flac", "a.flac", "sub/.cache/c.wav", "sub/b.mp3"}));
}

void TestTreeWalker::testEveryCallIsAFreshTraversal()
{
    const QStringList first = TreeWalker::walkFiles(m_dir.path(), false);
    const QStringList second = TreeWalker::walkFiles(m_dir.path(), false);
    QCOMPARE(first.size(), 2);
    QCOMPARE(first, second);
}

void TestTreeWalker::testMissingRootIsEmpty()
{
    QVERIFY(TreeWalker::walkFiles(m_dir.filePath("does-not-exist"), true).isEmpty());
}

QTEST_APPLESS_MAIN(TestTreeWalker)
#include "test_tree_walker.moc"
