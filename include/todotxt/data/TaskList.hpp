#pragma once

#include <QString>
#include <functional>
#include <optional>
#include <vector>

#include "todotxt/data/Todo.hpp"
#include "todotxt/data/TodoError.hpp"

namespace todotxt {
namespace data {

class LineSource;
class TaskSink;

// Index-scoped edits outside [0, size()) return the list unchanged.
class TaskList
{
public:
    using Update = std::function<TodoItem(const TodoItem &)>;

    TaskList() = default;
    explicit TaskList(std::vector<TodoItem> items, QString location = {});

    // Empty lines are skipped. A failing source aborts the read with TodoError::Io.
    static std::optional<TaskList> read(LineSource &source, TodoError *error = nullptr);
    static std::optional<TaskList> load(const QString &filePath, TodoError *error = nullptr);

    const QString &location() const;

    const std::vector<TodoItem> &items() const;
    int size() const;
    bool isEmpty() const;
    bool contains(int index) const;
    const TodoItem &at(int index) const;

    TaskList updatedAt(int index, const Update &update) const;
    TaskList completedAt(int index) const;
    TaskList withCompletedAt(int index, bool completed) const;
    std::optional<TaskList> withPriorityAt(int index, const QString &priority, TodoError *error = nullptr) const;
    TaskList withoutPriorityAt(int index) const;
    TaskList withTaskAt(int index, const QString &task) const;
    TaskList withTaskAppendedAt(int index, const QString &text) const;
    TaskList withTaskPrependedAt(int index, const QString &text) const;

    // One line per item, joined by '\n', no trailing newline.
    QString serialize() const;
    bool write(TaskSink &sink, TodoError *error = nullptr) const;
    bool save(TodoError *error = nullptr) const;

    bool operator==(const TaskList &other) const;
    bool operator!=(const TaskList &other) const;

private:
    std::vector<TodoItem> m_items;
    QString m_location;
};

} // namespace data
} // namespace todotxt
