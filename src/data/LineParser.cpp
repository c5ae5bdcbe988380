#include "todotxt/data/LineParser.hpp"

namespace todotxt {
namespace data {

namespace {
constexpr int YEAR_DIGITS = 4;
constexpr int MONTH_DIGITS = 2;
constexpr int DAY_DIGITS = 2;

bool isBlank(QChar c)
{
    return c == QLatin1Char(' ') || c == QLatin1Char('\t');
}

int skipBlanks(const QString &text, int pos)
{
    while (pos < text.size() && isBlank(text.at(pos))) {
        ++pos;
    }
    return pos;
}

bool readNumber(const QString &text, int pos, int digits, int &value)
{
    if (pos + digits > text.size()) {
        return false;
    }
    value = 0;
    for (int i = 0; i < digits; ++i) {
        const QChar c = text.at(pos + i);
        if (c < QLatin1Char('0') || c > QLatin1Char('9')) {
            return false;
        }
        value = value * 10 + (c.unicode() - '0');
    }
    return true;
}

bool readDash(const QString &text, int pos)
{
    return pos < text.size() && text.at(pos) == QLatin1Char('-');
}

// Matches YYYY-MM-DD at |pos| and moves |pos| past it. Leaves |pos|
// untouched when the text is not a real calendar date.
bool readDate(const QString &text, int &pos, QDate &date)
{
    int at = pos;
    int year = 0;
    int month = 0;
    int day = 0;

    if (!readNumber(text, at, YEAR_DIGITS, year)) {
        return false;
    }
    at += YEAR_DIGITS;
    if (!readDash(text, at)) {
        return false;
    }
    ++at;
    if (!readNumber(text, at, MONTH_DIGITS, month)) {
        return false;
    }
    at += MONTH_DIGITS;
    if (!readDash(text, at)) {
        return false;
    }
    ++at;
    if (!readNumber(text, at, DAY_DIGITS, day)) {
        return false;
    }
    at += DAY_DIGITS;

    if (!QDate::isValid(year, month, day)) {
        return false;
    }
    date = QDate(year, month, day);
    pos = at;
    return true;
}

bool readCompletion(const QString &text, int &pos)
{
    if (pos >= text.size() || text.at(pos) != QLatin1Char('x')) {
        return false;
    }
    // "xylophone" is task text, not a marker.
    if (pos + 1 < text.size() && !isBlank(text.at(pos + 1))) {
        return false;
    }
    ++pos;
    return true;
}

bool readPriority(const QString &text, int &pos, QChar &priority)
{
    if (pos + 3 > text.size()) {
        return false;
    }
    if (text.at(pos) != QLatin1Char('(') || text.at(pos + 2) != QLatin1Char(')')) {
        return false;
    }
    const QChar letter = text.at(pos + 1);
    if (!isPriorityLetter(letter)) {
        return false;
    }
    priority = letter;
    pos += 3;
    return true;
}

bool readEndAndStartDate(const QString &text, int &pos, QDate &endDate, QDate &startDate)
{
    int at = pos;
    QDate first;
    QDate second;
    if (!readDate(text, at, first)) {
        return false;
    }
    const int afterFirst = at;
    at = skipBlanks(text, at);
    if (at == afterFirst) {
        return false;
    }
    if (!readDate(text, at, second)) {
        return false;
    }
    endDate = first;
    startDate = second;
    pos = at;
    return true;
}

// A lone date glued to more text would serialize with a space after it and
// could then read back as the two-date form.
bool readStartDate(const QString &text, int &pos, QDate &startDate)
{
    int at = pos;
    QDate date;
    if (!readDate(text, at, date)) {
        return false;
    }
    if (at < text.size() && !isBlank(text.at(at))) {
        return false;
    }
    startDate = date;
    pos = at;
    return true;
}

// Ordered choice: the two-date form is tried first so that a creation date
// is never left behind as the start of the task text.
void readDateClause(const QString &text, int &pos, ParsedLine &parsed)
{
    if (readEndAndStartDate(text, pos, parsed.endDate, parsed.startDate)) {
        return;
    }
    readStartDate(text, pos, parsed.startDate);
}
} // namespace

std::optional<ParsedLine> parseLine(const QString &raw, TodoError *error)
{
    if (raw.isEmpty()) {
        reportError(error, TodoError::NoData);
        return std::nullopt;
    }

    ParsedLine parsed;
    int pos = skipBlanks(raw, 0);

    parsed.completed = readCompletion(raw, pos);
    pos = skipBlanks(raw, pos);

    readPriority(raw, pos, parsed.priority);
    pos = skipBlanks(raw, pos);

    readDateClause(raw, pos, parsed);
    pos = skipBlanks(raw, pos);

    parsed.task = raw.mid(pos);
    return parsed;
}

bool isPriorityLetter(QChar c)
{
    return c >= QLatin1Char('A') && c <= QLatin1Char('Z');
}

QString formatDate(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return QStringLiteral("%1-%2-%3")
        .arg(date.year(), YEAR_DIGITS, 10, QLatin1Char('0'))
        .arg(date.month(), MONTH_DIGITS, 10, QLatin1Char('0'))
        .arg(date.day(), DAY_DIGITS, 10, QLatin1Char('0'));
}

} // namespace data
} // namespace todotxt
