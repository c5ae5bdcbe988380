#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "todotxt/data/FileTaskStorage.hpp"
#include "todotxt/data/TaskList.hpp"

using namespace todotxt::data;

namespace {

void writeRaw(const QString &path, const QByteArray &bytes)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(bytes);
}

} // namespace

class FileTaskStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void readsLinesTrimmed();
    void missingFileIsIoError();
    void saveAndLoad();
    void saveCreatesDirectory();
};

void FileTaskStorageTest::readsLinesTrimmed()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("todo.txt"));
    writeRaw(path, "x Call Mom  \r\n\r\n   \n(A) Buy milk\n");

    const auto tasks = TaskList::load(path);
    QVERIFY(tasks.has_value());
    QCOMPARE(tasks->size(), 2);
    QCOMPARE(tasks->location(), path);
    QCOMPARE(tasks->at(0).task(), QStringLiteral("Call Mom"));
    QCOMPARE(tasks->at(1).toString(), QStringLiteral("(A) Buy milk"));
}

void FileTaskStorageTest::missingFileIsIoError()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    FileTaskStorage storage(dir.filePath(QStringLiteral("absent.txt")));
    QString line;
    QVERIFY(!storage.readLine(line));
    QVERIFY(!storage.errorString().isEmpty());

    TodoError error;
    QVERIFY(!TaskList::load(dir.filePath(QStringLiteral("absent.txt")), &error).has_value());
    QCOMPARE(error.code, TodoError::Io);
}

void FileTaskStorageTest::saveAndLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("todo.txt"));
    writeRaw(path, "Learn to +drive @goals\nBuy Grüntee\n");

    const auto tasks = TaskList::load(path);
    QVERIFY(tasks.has_value());
    const auto edited = tasks->completedAt(0);
    TodoError error;
    QVERIFY(edited.save(&error));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(QString::fromUtf8(file.readAll()), QStringLiteral("x Learn to +drive @goals\nBuy Grüntee"));

    const auto reloaded = TaskList::load(path);
    QVERIFY(reloaded.has_value());
    QVERIFY(*reloaded == edited);
}

void FileTaskStorageTest::saveCreatesDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/deeper/todo.txt"));

    FileTaskStorage storage(path);
    QString failure;
    QVERIFY(storage.overwrite(QStringLiteral("(C) Fresh start"), &failure));
    QVERIFY(failure.isEmpty());
    QVERIFY(QFile::exists(path));
}

QTEST_GUILESS_MAIN(FileTaskStorageTest)
#include "FileTaskStorageTest.moc"
