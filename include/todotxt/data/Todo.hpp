#pragma once

#include <QChar>
#include <QDate>
#include <QString>
#include <QStringList>
#include <optional>

#include "todotxt/data/LineParser.hpp"
#include "todotxt/data/TodoError.hpp"

namespace todotxt {
namespace data {

// Setters return a modified copy.
class TodoItem
{
public:
    TodoItem() = default;

    static TodoItem fromParsed(const ParsedLine &parsed);
    static std::optional<TodoItem> parse(const QString &line, TodoError *error = nullptr);

    bool isCompleted() const;
    bool hasPriority() const;
    QChar priority() const;
    QDate startDate() const;
    QDate endDate() const;
    const QString &task() const;
    const QStringList &projects() const;
    const QStringList &contexts() const;

    std::optional<TodoItem> withPriority(const QString &priority, TodoError *error = nullptr) const;
    TodoItem withoutPriority() const;
    TodoItem withStartDate(const QDate &date) const;
    TodoItem withEndDate(const QDate &date) const;
    TodoItem withTask(const QString &task) const;
    TodoItem withTaskAppended(const QString &text) const;
    TodoItem withTaskPrepended(const QString &text) const;
    TodoItem withCompleted(bool completed) const;
    TodoItem completed() const;

    // Inverse of parse(): "x ", "(P) ", end date, start date, then the task.
    QString toString() const;

    bool operator==(const TodoItem &other) const;
    bool operator!=(const TodoItem &other) const;

private:
    void refreshTags();

    static QStringList tagsWithPrefix(const QString &task, QChar prefix);
    static QString joinTaskText(const QString &first, const QString &second);

    bool m_completed = false;
    QChar m_priority;
    QDate m_startDate;
    QDate m_endDate;
    QString m_task;
    QStringList m_projects;
    QStringList m_contexts;
};

} // namespace data
} // namespace todotxt
