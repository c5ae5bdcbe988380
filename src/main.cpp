#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "todotxt/cli/TaskCommands.hpp"
#include "todotxt/core/AppContext.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("todotxt"));
    QCoreApplication::setApplicationName(QStringLiteral("todotxt"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTodoTxtVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Edit a todo.txt task list"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption fileOption({ QStringLiteral("f"), QStringLiteral("file") },
                                        QObject::tr("Task file to use instead of the configured one."),
                                        QObject::tr("path"));
    const QCommandLineOption rememberOption(QStringLiteral("remember"),
                                            QObject::tr("Store the task file path as the default."));
    parser.addOption(fileOption);
    parser.addOption(rememberOption);
    parser.addPositionalArgument(QStringLiteral("command"), QObject::tr("list, do, undo, pri, depri, replace, append or prepend"));
    parser.process(app);

    todotxt::core::AppContext context(parser.value(fileOption));
    if (parser.isSet(rememberOption)) {
        context.rememberTaskFilePath();
    }

    QTextStream out(stdout);
    QTextStream err(stderr);
    todotxt::cli::TaskCommands commands(context, out, err);
    return commands.run(parser.positionalArguments());
}
