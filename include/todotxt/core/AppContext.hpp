#pragma once

#include <QString>
#include <optional>

#include "todotxt/data/TaskList.hpp"
#include "todotxt/data/TodoError.hpp"

namespace todotxt {
namespace core {

class AppContext
{
public:
    explicit AppContext(QString taskFilePathOverride = {});
    ~AppContext();

    const QString &taskFilePath() const;

    // A task file that does not exist yet loads as an empty list.
    std::optional<data::TaskList> loadTasks(data::TodoError *error = nullptr) const;
    bool saveTasks(const data::TaskList &tasks, data::TodoError *error = nullptr) const;

    void rememberTaskFilePath() const;

    static QString defaultTaskFilePath();

private:
    QString m_taskFilePath;
};

} // namespace core
} // namespace todotxt
