#include "todotxt/data/FileTaskStorage.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSaveFile>
#include <utility>

namespace todotxt {
namespace data {

FileTaskStorage::FileTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

FileTaskStorage::~FileTaskStorage() = default;

QString FileTaskStorage::location() const
{
    return m_filePath;
}

bool FileTaskStorage::readLine(QString &line)
{
    if (m_readFailed) {
        return false;
    }
    if (!m_stream && !openForReading()) {
        return false;
    }
    if (m_stream->atEnd()) {
        m_file->close();
        return false;
    }

    line = trimTrailing(m_stream->readLine());
    if (m_stream->status() != QTextStream::Ok) {
        fail(QStringLiteral("Failed to read %1").arg(m_filePath));
        return false;
    }
    return true;
}

QString FileTaskStorage::errorString() const
{
    return m_errorString;
}

bool FileTaskStorage::overwrite(const QString &contents, QString *errorString)
{
    auto reportFailure = [&](const QString &message) {
        qWarning() << "FileTaskStorage:" << message;
        if (errorString) {
            *errorString = message;
        }
        return false;
    };

    if (m_filePath.isEmpty()) {
        return reportFailure(QStringLiteral("No file path to write to"));
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return reportFailure(QStringLiteral("Cannot create directory %1").arg(dir.path()));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return reportFailure(QStringLiteral("Cannot open %1: %2").arg(m_filePath, file.errorString()));
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << contents;
    stream.flush();

    if (stream.status() != QTextStream::Ok) {
        file.cancelWriting();
        return reportFailure(QStringLiteral("Failed to write %1").arg(m_filePath));
    }
    if (!file.commit()) {
        return reportFailure(QStringLiteral("Cannot save %1: %2").arg(m_filePath, file.errorString()));
    }
    return true;
}

bool FileTaskStorage::openForReading()
{
    m_file = std::make_unique<QFile>(m_filePath);
    if (!m_file->exists()) {
        fail(QStringLiteral("%1 does not exist").arg(m_filePath));
        return false;
    }
    if (!m_file->open(QIODevice::ReadOnly | QIODevice::Text)) {
        fail(QStringLiteral("Cannot open %1: %2").arg(m_filePath, m_file->errorString()));
        return false;
    }
    m_stream = std::make_unique<QTextStream>(m_file.get());
    m_stream->setCodec("UTF-8");
    return true;
}

void FileTaskStorage::fail(const QString &message)
{
    qWarning() << "FileTaskStorage:" << message;
    m_errorString = message;
    m_readFailed = true;
    m_stream.reset();
    if (m_file) {
        m_file->close();
    }
}

QString FileTaskStorage::trimTrailing(const QString &line)
{
    int end = line.size();
    while (end > 0 && line.at(end - 1).isSpace()) {
        --end;
    }
    return line.left(end);
}

} // namespace data
} // namespace todotxt
