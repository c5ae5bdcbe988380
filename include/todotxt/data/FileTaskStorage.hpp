#pragma once

#include <QFile>
#include <QString>
#include <QTextStream>
#include <memory>

#include "todotxt/data/LineSource.hpp"
#include "todotxt/data/TaskSink.hpp"

namespace todotxt {
namespace data {

class FileTaskStorage : public LineSource, public TaskSink
{
public:
    explicit FileTaskStorage(QString filePath);
    ~FileTaskStorage() override;

    QString location() const override;
    bool readLine(QString &line) override;
    QString errorString() const override;

    bool overwrite(const QString &contents, QString *errorString) override;

private:
    bool openForReading();
    void fail(const QString &message);

    static QString trimTrailing(const QString &line);

    QString m_filePath;
    QString m_errorString;
    std::unique_ptr<QFile> m_file;
    std::unique_ptr<QTextStream> m_stream;
    bool m_readFailed = false;
};

} // namespace data
} // namespace todotxt
