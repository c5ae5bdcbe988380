#include <QtTest/QtTest>

#include "todotxt/data/LineParser.hpp"

using namespace todotxt::data;

class LineParserTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyLineHasNoData();
    void whitespaceOnlyLineParses();
    void completedTask();
    void completionMarkerNeedsSeparator();
    void priority();
    void lowercasePriorityIsTaskText();
    void oneDate();
    void twoDatesEndDateFirst();
    void everyToken();
    void metadataOnly();
    void invalidDateFallsThroughToTask();
    void invalidSecondDateKeepsFirst();
    void leapDay_data();
    void leapDay();
    void datesNeedWhitespaceBetween();
    void dateNeedsSeparatorFromTask();
    void whitespaceRunsAreConsumed();
    void formatDatePadsFields();
};

void LineParserTest::emptyLineHasNoData()
{
    TodoError error;
    const auto parsed = parseLine(QString(), &error);
    QVERIFY(!parsed.has_value());
    QCOMPARE(error.code, TodoError::NoData);
}

void LineParserTest::whitespaceOnlyLineParses()
{
    TodoError error;
    const auto parsed = parseLine(QStringLiteral("   "), &error);
    QVERIFY(parsed.has_value());
    QCOMPARE(error.code, TodoError::NoError);
    QVERIFY(!parsed->completed);
    QVERIFY(parsed->task.isEmpty());
}

void LineParserTest::completedTask()
{
    const auto parsed = parseLine(QStringLiteral("x Call Mom"));
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->completed);
    QVERIFY(parsed->priority.isNull());
    QCOMPARE(parsed->task, QStringLiteral("Call Mom"));
}

void LineParserTest::completionMarkerNeedsSeparator()
{
    const auto parsed = parseLine(QStringLiteral("xylophone lessons"));
    QVERIFY(parsed.has_value());
    QVERIFY(!parsed->completed);
    QCOMPARE(parsed->task, QStringLiteral("xylophone lessons"));
}

void LineParserTest::priority()
{
    const auto parsed = parseLine(QStringLiteral("(A) Buy milk"));
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->priority, QChar('A'));
    QCOMPARE(parsed->task, QStringLiteral("Buy milk"));
}

void LineParserTest::lowercasePriorityIsTaskText()
{
    const auto parsed = parseLine(QStringLiteral("(a) Buy milk"));
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->priority.isNull());
    QCOMPARE(parsed->task, QStringLiteral("(a) Buy milk"));
}

void LineParserTest::oneDate()
{
    const auto parsed = parseLine(QStringLiteral("(C) 2014-01-01 Learn to +drive @goals"));
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->priority, QChar('C'));
    QCOMPARE(parsed->startDate, QDate(2014, 1, 1));
    QVERIFY(parsed->endDate.isNull());
    QCOMPARE(parsed->task, QStringLiteral("Learn to +drive @goals"));
}

void LineParserTest::twoDatesEndDateFirst()
{
    const auto parsed = parseLine(QStringLiteral("2021-01-02 2021-01-01 Make a New Years Resolution"));
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->endDate, QDate(2021, 1, 2));
    QCOMPARE(parsed->startDate, QDate(2021, 1, 1));
    QCOMPARE(parsed->task, QStringLiteral("Make a New Years Resolution"));
}

void LineParserTest::everyToken()
{
    const auto parsed = parseLine(QStringLiteral("x (A) 2021-01-02 2021-01-01 Make a New Years Resolution"));
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->completed);
    QCOMPARE(parsed->priority, QChar('A'));
    QCOMPARE(parsed->endDate, QDate(2021, 1, 2));
    QCOMPARE(parsed->startDate, QDate(2021, 1, 1));
    QCOMPARE(parsed->task, QStringLiteral("Make a New Years Resolution"));
}

void LineParserTest::metadataOnly()
{
    const auto parsed = parseLine(QStringLiteral("x (B) 2020-05-05"));
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->completed);
    QCOMPARE(parsed->priority, QChar('B'));
    QCOMPARE(parsed->startDate, QDate(2020, 5, 5));
    QVERIFY(parsed->task.isEmpty());
}

void LineParserTest::invalidDateFallsThroughToTask()
{
    const auto parsed = parseLine(QStringLiteral("2021-13-01 Not a month"));
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->startDate.isNull());
    QCOMPARE(parsed->task, QStringLiteral("2021-13-01 Not a month"));
}

void LineParserTest::invalidSecondDateKeepsFirst()
{
    const auto parsed = parseLine(QStringLiteral("2021-01-01 2021-02-30 Pay rent"));
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->endDate.isNull());
    QCOMPARE(parsed->startDate, QDate(2021, 1, 1));
    QCOMPARE(parsed->task, QStringLiteral("2021-02-30 Pay rent"));
}

void LineParserTest::leapDay_data()
{
    QTest::addColumn<QString>("line");
    QTest::addColumn<bool>("hasDate");

    QTest::newRow("leap year") << QStringLiteral("2020-02-29 Leap") << true;
    QTest::newRow("common year") << QStringLiteral("2021-02-29 Leap") << false;
    QTest::newRow("century") << QStringLiteral("1900-02-29 Leap") << false;
    QTest::newRow("400th year") << QStringLiteral("2000-02-29 Leap") << true;
}

void LineParserTest::leapDay()
{
    QFETCH(QString, line);
    QFETCH(bool, hasDate);

    const auto parsed = parseLine(line);
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->startDate.isValid(), hasDate);
    QCOMPARE(parsed->task, hasDate ? QStringLiteral("Leap") : line);
}

void LineParserTest::datesNeedWhitespaceBetween()
{
    const auto parsed = parseLine(QStringLiteral("2021-01-022021-01-01 Glued"));
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->endDate.isNull());
    QVERIFY(parsed->startDate.isNull());
    QCOMPARE(parsed->task, QStringLiteral("2021-01-022021-01-01 Glued"));
}

void LineParserTest::dateNeedsSeparatorFromTask()
{
    const auto glued = parseLine(QStringLiteral("(A) 2021-01-01abc"));
    QVERIFY(glued.has_value());
    QCOMPARE(glued->priority, QChar('A'));
    QVERIFY(glued->startDate.isNull());
    QCOMPARE(glued->task, QStringLiteral("2021-01-01abc"));

    const auto endOfLine = parseLine(QStringLiteral("2021-01-01"));
    QVERIFY(endOfLine.has_value());
    QCOMPARE(endOfLine->startDate, QDate(2021, 1, 1));
    QVERIFY(endOfLine->task.isEmpty());
}

void LineParserTest::whitespaceRunsAreConsumed()
{
    const auto parsed = parseLine(QStringLiteral("x  (A)\t2021-01-02   2021-01-01  Spaced  out"));
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->completed);
    QCOMPARE(parsed->priority, QChar('A'));
    QCOMPARE(parsed->endDate, QDate(2021, 1, 2));
    QCOMPARE(parsed->startDate, QDate(2021, 1, 1));
    QCOMPARE(parsed->task, QStringLiteral("Spaced  out"));
}

void LineParserTest::formatDatePadsFields()
{
    QCOMPARE(formatDate(QDate(2021, 3, 4)), QStringLiteral("2021-03-04"));
    QCOMPARE(formatDate(QDate(987, 12, 31)), QStringLiteral("0987-12-31"));
    QVERIFY(formatDate(QDate()).isEmpty());
}

QTEST_GUILESS_MAIN(LineParserTest)
#include "LineParserTest.moc"
