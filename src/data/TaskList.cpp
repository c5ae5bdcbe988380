#include "todotxt/data/TaskList.hpp"

#include <QDebug>
#include <QStringList>
#include <utility>

#include "todotxt/data/FileTaskStorage.hpp"
#include "todotxt/data/LineSource.hpp"
#include "todotxt/data/TaskSink.hpp"

namespace todotxt {
namespace data {

TaskList::TaskList(std::vector<TodoItem> items, QString location)
    : m_items(std::move(items))
    , m_location(std::move(location))
{
}

std::optional<TaskList> TaskList::read(LineSource &source, TodoError *error)
{
    std::vector<TodoItem> items;
    int skipped = 0;
    QString line;
    while (source.readLine(line)) {
        auto todo = TodoItem::parse(line);
        if (!todo) {
            ++skipped;
            continue;
        }
        items.push_back(std::move(*todo));
    }

    const QString failure = source.errorString();
    if (!failure.isEmpty()) {
        reportError(error, TodoError::Io, failure);
        return std::nullopt;
    }
    if (skipped > 0) {
        qDebug() << "TaskList: skipped" << skipped << "empty line(s) in" << source.location();
    }
    return TaskList(std::move(items), source.location());
}

std::optional<TaskList> TaskList::load(const QString &filePath, TodoError *error)
{
    FileTaskStorage storage(filePath);
    return read(storage, error);
}

const QString &TaskList::location() const
{
    return m_location;
}

const std::vector<TodoItem> &TaskList::items() const
{
    return m_items;
}

int TaskList::size() const
{
    return static_cast<int>(m_items.size());
}

bool TaskList::isEmpty() const
{
    return m_items.empty();
}

bool TaskList::contains(int index) const
{
    return index >= 0 && index < size();
}

const TodoItem &TaskList::at(int index) const
{
    return m_items.at(static_cast<size_t>(index));
}

TaskList TaskList::updatedAt(int index, const Update &update) const
{
    if (!contains(index) || !update) {
        return *this;
    }
    TaskList copy = *this;
    auto &slot = copy.m_items[static_cast<size_t>(index)];
    slot = update(slot);
    return copy;
}

TaskList TaskList::completedAt(int index) const
{
    return updatedAt(index, [](const TodoItem &todo) { return todo.completed(); });
}

TaskList TaskList::withCompletedAt(int index, bool completed) const
{
    return updatedAt(index, [completed](const TodoItem &todo) { return todo.withCompleted(completed); });
}

std::optional<TaskList> TaskList::withPriorityAt(int index, const QString &priority, TodoError *error) const
{
    // Reported even when |index| names no item.
    if (!TodoItem().withPriority(priority, error)) {
        return std::nullopt;
    }
    return updatedAt(index, [&priority](const TodoItem &todo) { return *todo.withPriority(priority); });
}

TaskList TaskList::withoutPriorityAt(int index) const
{
    return updatedAt(index, [](const TodoItem &todo) { return todo.withoutPriority(); });
}

TaskList TaskList::withTaskAt(int index, const QString &task) const
{
    return updatedAt(index, [&task](const TodoItem &todo) { return todo.withTask(task); });
}

TaskList TaskList::withTaskAppendedAt(int index, const QString &text) const
{
    return updatedAt(index, [&text](const TodoItem &todo) { return todo.withTaskAppended(text); });
}

TaskList TaskList::withTaskPrependedAt(int index, const QString &text) const
{
    return updatedAt(index, [&text](const TodoItem &todo) { return todo.withTaskPrepended(text); });
}

QString TaskList::serialize() const
{
    QStringList lines;
    lines.reserve(size());
    for (const auto &todo : m_items) {
        lines << todo.toString();
    }
    return lines.join(QLatin1Char('\n'));
}

bool TaskList::write(TaskSink &sink, TodoError *error) const
{
    QString failure;
    if (!sink.overwrite(serialize(), &failure)) {
        reportError(error, TodoError::Io, failure);
        return false;
    }
    return true;
}

bool TaskList::save(TodoError *error) const
{
    if (m_location.isEmpty()) {
        reportError(error, TodoError::Io, QStringLiteral("Task list has no location to save to"));
        return false;
    }
    FileTaskStorage storage(m_location);
    return write(storage, error);
}

bool TaskList::operator==(const TaskList &other) const
{
    return m_location == other.m_location && m_items == other.m_items;
}

bool TaskList::operator!=(const TaskList &other) const
{
    return !(*this == other);
}

} // namespace data
} // namespace todotxt
