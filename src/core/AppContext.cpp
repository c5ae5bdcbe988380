#include "todotxt/core/AppContext.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <utility>

#include "todotxt/data/FileTaskStorage.hpp"

namespace todotxt {
namespace core {

namespace {
constexpr auto TASK_FILE_KEY = "storage/todoFile";
constexpr auto TASK_FILE_NAME = "todo.txt";
} // namespace

AppContext::AppContext(QString taskFilePathOverride)
    : m_taskFilePath(std::move(taskFilePathOverride))
{
    if (m_taskFilePath.isEmpty()) {
        QSettings settings;
        m_taskFilePath = settings.value(QLatin1String(TASK_FILE_KEY)).toString();
    }
    if (m_taskFilePath.isEmpty()) {
        m_taskFilePath = defaultTaskFilePath();
    }
}

AppContext::~AppContext() = default;

const QString &AppContext::taskFilePath() const
{
    return m_taskFilePath;
}

std::optional<data::TaskList> AppContext::loadTasks(data::TodoError *error) const
{
    if (!QFileInfo::exists(m_taskFilePath)) {
        qDebug() << "AppContext:" << m_taskFilePath << "not found, starting with an empty list";
        return data::TaskList({}, m_taskFilePath);
    }
    data::FileTaskStorage storage(m_taskFilePath);
    return data::TaskList::read(storage, error);
}

bool AppContext::saveTasks(const data::TaskList &tasks, data::TodoError *error) const
{
    data::FileTaskStorage storage(m_taskFilePath);
    return tasks.write(storage, error);
}

void AppContext::rememberTaskFilePath() const
{
    QSettings settings;
    settings.setValue(QLatin1String(TASK_FILE_KEY), QFileInfo(m_taskFilePath).absoluteFilePath());
}

QString AppContext::defaultTaskFilePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/todotxt");
    }
    return QDir(storageFolder).filePath(QLatin1String(TASK_FILE_NAME));
}

} // namespace core
} // namespace todotxt
