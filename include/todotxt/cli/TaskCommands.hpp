#pragma once

#include <QString>
#include <QStringList>
#include <QTextStream>

namespace todotxt {
namespace core {
class AppContext;
}

namespace data {
class TaskList;
}

namespace cli {

// Item numbers on the command line start at 1.
class TaskCommands
{
public:
    enum ExitCode
    {
        Success = 0,
        Failure = 1,
        UsageError = 2,
    };

    TaskCommands(core::AppContext &context, QTextStream &out, QTextStream &err);

    int run(const QStringList &arguments);

    static QString usage();

private:
    using Edit = data::TaskList (*)(const data::TaskList &, int, const QString &);

    int dispatch(const data::TaskList &tasks, const QStringList &arguments, int index);
    int list(const data::TaskList &tasks);
    int apply(const data::TaskList &tasks, const data::TaskList &updated, int index, const QString &number);
    int setPriority(const data::TaskList &tasks, int index, const QString &number, const QString &priority);
    int editTask(const data::TaskList &tasks, const QStringList &arguments, int index, Edit edit);

    static bool parseItemNumber(const QString &text, int &index);
    int commit(const data::TaskList &tasks, int index);
    int printUsage();

    core::AppContext &m_context;
    QTextStream &m_out;
    QTextStream &m_err;
};

} // namespace cli
} // namespace todotxt
