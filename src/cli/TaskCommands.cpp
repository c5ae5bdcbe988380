#include "todotxt/cli/TaskCommands.hpp"

#include "todotxt/core/AppContext.hpp"
#include "todotxt/data/TaskList.hpp"
#include "todotxt/data/TodoError.hpp"

namespace todotxt {
namespace cli {

namespace {
constexpr int UNBOUNDED = -1;

struct CommandShape
{
    const char *name;
    int minArguments;
    int maxArguments;
    bool takesItem;
};

constexpr CommandShape COMMANDS[] = {
    { "list", 0, 0, false },
    { "ls", 0, 0, false },
    { "do", 1, 1, true },
    { "undo", 1, 1, true },
    { "pri", 2, 2, true },
    { "depri", 1, 1, true },
    { "replace", 2, UNBOUNDED, true },
    { "append", 2, UNBOUNDED, true },
    { "prepend", 2, UNBOUNDED, true },
};

const CommandShape *findCommand(const QString &name)
{
    for (const auto &command : COMMANDS) {
        if (name == QLatin1String(command.name)) {
            return &command;
        }
    }
    return nullptr;
}
} // namespace

TaskCommands::TaskCommands(core::AppContext &context, QTextStream &out, QTextStream &err)
    : m_context(context)
    , m_out(out)
    , m_err(err)
{
}

int TaskCommands::run(const QStringList &arguments)
{
    if (arguments.isEmpty()) {
        return printUsage();
    }
    const CommandShape *shape = findCommand(arguments.front());
    if (!shape) {
        return printUsage();
    }
    const int count = arguments.size() - 1;
    if (count < shape->minArguments || (shape->maxArguments != UNBOUNDED && count > shape->maxArguments)) {
        return printUsage();
    }
    int index = -1;
    if (shape->takesItem && !parseItemNumber(arguments.at(1), index)) {
        return printUsage();
    }

    data::TodoError error;
    const auto tasks = m_context.loadTasks(&error);
    if (!tasks) {
        m_err << "todotxt: " << error.errorString() << '\n';
        m_err.flush();
        return Failure;
    }
    return dispatch(*tasks, arguments, index);
}

QString TaskCommands::usage()
{
    return QStringLiteral(
        "Usage: todotxt [--file <path>] [--remember] <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  list                 Show all items with their numbers\n"
        "  do <n>               Mark item n as completed\n"
        "  undo <n>             Mark item n as not completed\n"
        "  pri <n> <A-Z>        Set the priority of item n\n"
        "  depri <n>            Remove the priority of item n\n"
        "  replace <n> <text>   Replace the text of item n\n"
        "  append <n> <text>    Add text to the end of item n\n"
        "  prepend <n> <text>   Add text to the start of item n\n");
}

int TaskCommands::dispatch(const data::TaskList &tasks, const QStringList &arguments, int index)
{
    const QString &command = arguments.front();
    if (command == QLatin1String("list") || command == QLatin1String("ls")) {
        return list(tasks);
    }

    const QString &number = arguments.at(1);
    if (command == QLatin1String("do")) {
        return apply(tasks, tasks.withCompletedAt(index, true), index, number);
    }
    if (command == QLatin1String("undo")) {
        return apply(tasks, tasks.withCompletedAt(index, false), index, number);
    }
    if (command == QLatin1String("pri")) {
        return setPriority(tasks, index, number, arguments.at(2));
    }
    if (command == QLatin1String("depri")) {
        return apply(tasks, tasks.withoutPriorityAt(index), index, number);
    }
    if (command == QLatin1String("replace")) {
        return editTask(tasks, arguments, index, [](const data::TaskList &list, int at, const QString &text) {
            return list.withTaskAt(at, text);
        });
    }
    if (command == QLatin1String("append")) {
        return editTask(tasks, arguments, index, [](const data::TaskList &list, int at, const QString &text) {
            return list.withTaskAppendedAt(at, text);
        });
    }
    return editTask(tasks, arguments, index, [](const data::TaskList &list, int at, const QString &text) {
        return list.withTaskPrependedAt(at, text);
    });
}

int TaskCommands::list(const data::TaskList &tasks)
{
    for (int i = 0; i < tasks.size(); ++i) {
        m_out << (i + 1) << ' ' << tasks.at(i).toString() << '\n';
    }
    m_out.flush();
    return Success;
}

int TaskCommands::apply(const data::TaskList &tasks, const data::TaskList &updated, int index, const QString &number)
{
    if (!tasks.contains(index)) {
        m_out << "todotxt: no item " << number << ", nothing changed\n";
        m_out.flush();
        return Success;
    }
    return commit(updated, index);
}

int TaskCommands::setPriority(const data::TaskList &tasks, int index, const QString &number, const QString &priority)
{
    data::TodoError error;
    const auto updated = tasks.withPriorityAt(index, priority, &error);
    if (!updated) {
        m_err << "todotxt: " << error.errorString() << '\n';
        m_err.flush();
        return Failure;
    }
    return apply(tasks, *updated, index, number);
}

int TaskCommands::editTask(const data::TaskList &tasks, const QStringList &arguments, int index, Edit edit)
{
    const QString text = arguments.mid(2).join(QLatin1Char(' '));
    return apply(tasks, edit(tasks, index, text), index, arguments.at(1));
}

bool TaskCommands::parseItemNumber(const QString &text, int &index)
{
    bool ok = false;
    const int number = text.toInt(&ok);
    if (!ok) {
        return false;
    }
    // Numbers below 1 name no item.
    index = number > 0 ? number - 1 : -1;
    return true;
}

int TaskCommands::commit(const data::TaskList &tasks, int index)
{
    data::TodoError error;
    if (!m_context.saveTasks(tasks, &error)) {
        m_err << "todotxt: " << error.errorString() << '\n';
        m_err.flush();
        return Failure;
    }
    m_out << (index + 1) << ' ' << tasks.at(index).toString() << '\n';
    m_out.flush();
    return Success;
}

int TaskCommands::printUsage()
{
    m_err << usage();
    m_err.flush();
    return UsageError;
}

} // namespace cli
} // namespace todotxt
