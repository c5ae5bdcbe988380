#pragma once

#include <QString>

namespace todotxt {
namespace data {

struct TodoError
{
    enum Code
    {
        NoError,
        NoData,
        InvalidPriority,
        Io,
    };

    Code code = NoError;
    QString message;

    QString errorString() const;
};

// Fills |error| when the caller asked for it.
void reportError(TodoError *error, TodoError::Code code, QString message = {});

} // namespace data
} // namespace todotxt
