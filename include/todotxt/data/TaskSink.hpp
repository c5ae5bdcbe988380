#pragma once

#include <QString>

namespace todotxt {
namespace data {

class TaskSink
{
public:
    virtual ~TaskSink() = default;

    virtual QString location() const = 0;
    virtual bool overwrite(const QString &contents, QString *errorString) = 0;
};

} // namespace data
} // namespace todotxt
