#pragma once

#include <QString>
#include <QStringList>

#include "todotxt/data/LineSource.hpp"
#include "todotxt/data/TaskSink.hpp"

namespace todotxt {
namespace data {

class InMemoryTaskStorage : public LineSource, public TaskSink
{
public:
    explicit InMemoryTaskStorage(QStringList lines = {}, QString location = {});
    ~InMemoryTaskStorage() override;

    QString location() const override;
    bool readLine(QString &line) override;
    QString errorString() const override;

    bool overwrite(const QString &contents, QString *errorString) override;

    const QString &contents() const;
    int writeCount() const;

    // Makes the next reads (after |afterLines| successful lines) or all
    // writes fail with |message|.
    void failReadsAfter(int afterLines, QString message);
    void failWrites(QString message);

private:
    QStringList m_lines;
    QString m_location;
    int m_nextLine = 0;
    int m_failReadAt = -1;
    QString m_readFailure;
    QString m_writeFailure;
    QString m_errorString;
    QString m_contents;
    int m_writeCount = 0;
};

} // namespace data
} // namespace todotxt
