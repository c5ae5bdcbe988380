#pragma once

#include <QChar>
#include <QDate>
#include <QString>
#include <optional>

#include "todotxt/data/TodoError.hpp"

namespace todotxt {
namespace data {

// Tokens recognized at the start of a todo.txt line. Unset dates are null
// QDates, an unset priority is a null QChar.
struct ParsedLine
{
    bool completed = false;
    QChar priority;
    QDate endDate;
    QDate startDate;
    QString task;
};

// Returns std::nullopt with TodoError::NoData only when |raw| is empty.
std::optional<ParsedLine> parseLine(const QString &raw, TodoError *error = nullptr);

bool isPriorityLetter(QChar c);

// YYYY-MM-DD, zero padded.
QString formatDate(const QDate &date);

} // namespace data
} // namespace todotxt
