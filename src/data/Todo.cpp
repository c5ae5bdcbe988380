#include "todotxt/data/Todo.hpp"

#include <QRegularExpression>

namespace todotxt {
namespace data {

namespace {
constexpr auto PROJECT_PREFIX = '+';
constexpr auto CONTEXT_PREFIX = '@';
} // namespace

TodoItem TodoItem::fromParsed(const ParsedLine &parsed)
{
    TodoItem todo;
    todo.m_completed = parsed.completed;
    todo.m_priority = parsed.priority;
    todo.m_startDate = parsed.startDate;
    todo.m_endDate = parsed.endDate;
    todo.m_task = parsed.task;
    todo.refreshTags();
    return todo;
}

std::optional<TodoItem> TodoItem::parse(const QString &line, TodoError *error)
{
    const auto parsed = parseLine(line, error);
    if (!parsed) {
        return std::nullopt;
    }
    return fromParsed(*parsed);
}

bool TodoItem::isCompleted() const
{
    return m_completed;
}

bool TodoItem::hasPriority() const
{
    return !m_priority.isNull();
}

QChar TodoItem::priority() const
{
    return m_priority;
}

QDate TodoItem::startDate() const
{
    return m_startDate;
}

QDate TodoItem::endDate() const
{
    return m_endDate;
}

const QString &TodoItem::task() const
{
    return m_task;
}

const QStringList &TodoItem::projects() const
{
    return m_projects;
}

const QStringList &TodoItem::contexts() const
{
    return m_contexts;
}

std::optional<TodoItem> TodoItem::withPriority(const QString &priority, TodoError *error) const
{
    if (priority.size() != 1 || !isPriorityLetter(priority.at(0))) {
        reportError(error, TodoError::InvalidPriority, priority);
        return std::nullopt;
    }
    TodoItem copy = *this;
    copy.m_priority = priority.at(0);
    return copy;
}

TodoItem TodoItem::withoutPriority() const
{
    TodoItem copy = *this;
    copy.m_priority = QChar();
    return copy;
}

TodoItem TodoItem::withStartDate(const QDate &date) const
{
    TodoItem copy = *this;
    copy.m_startDate = date.isValid() ? date : QDate();
    return copy;
}

TodoItem TodoItem::withEndDate(const QDate &date) const
{
    TodoItem copy = *this;
    copy.m_endDate = date.isValid() ? date : QDate();
    return copy;
}

TodoItem TodoItem::withTask(const QString &task) const
{
    TodoItem copy = *this;
    copy.m_task = task;
    copy.refreshTags();
    return copy;
}

TodoItem TodoItem::withTaskAppended(const QString &text) const
{
    return withTask(joinTaskText(m_task, text));
}

TodoItem TodoItem::withTaskPrepended(const QString &text) const
{
    return withTask(joinTaskText(text, m_task));
}

TodoItem TodoItem::withCompleted(bool completed) const
{
    TodoItem copy = *this;
    copy.m_completed = completed;
    return copy;
}

TodoItem TodoItem::completed() const
{
    return withCompleted(true);
}

QString TodoItem::toString() const
{
    QString line;
    if (m_completed) {
        line += QStringLiteral("x ");
    }
    if (hasPriority()) {
        line += QLatin1Char('(');
        line += m_priority;
        line += QStringLiteral(") ");
    }
    if (m_endDate.isValid()) {
        line += formatDate(m_endDate) + QLatin1Char(' ');
    }
    if (m_startDate.isValid()) {
        line += formatDate(m_startDate) + QLatin1Char(' ');
    }
    line += m_task;
    return line;
}

bool TodoItem::operator==(const TodoItem &other) const
{
    return m_completed == other.m_completed
        && m_priority == other.m_priority
        && m_startDate == other.m_startDate
        && m_endDate == other.m_endDate
        && m_task == other.m_task
        && m_projects == other.m_projects
        && m_contexts == other.m_contexts;
}

bool TodoItem::operator!=(const TodoItem &other) const
{
    return !(*this == other);
}

void TodoItem::refreshTags()
{
    m_projects = tagsWithPrefix(m_task, QLatin1Char(PROJECT_PREFIX));
    m_contexts = tagsWithPrefix(m_task, QLatin1Char(CONTEXT_PREFIX));
}

QStringList TodoItem::tagsWithPrefix(const QString &task, QChar prefix)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"),
                                               QRegularExpression::UseUnicodePropertiesOption);
    QStringList tags;
    const QStringList words = task.split(whitespace, Qt::SkipEmptyParts);
    for (const QString &word : words) {
        if (word.startsWith(prefix)) {
            tags << word.mid(1);
        }
    }
    return tags;
}

QString TodoItem::joinTaskText(const QString &first, const QString &second)
{
    if (first.isEmpty()) {
        return second;
    }
    if (second.isEmpty()) {
        return first;
    }
    return first + QLatin1Char(' ') + second;
}

} // namespace data
} // namespace todotxt
