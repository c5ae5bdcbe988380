#include "todotxt/data/TodoError.hpp"

#include <utility>

namespace todotxt {
namespace data {

QString TodoError::errorString() const
{
    switch (code) {
    case NoError:
        return QStringLiteral("no error occurred");
    case NoData:
        return QStringLiteral("line contains no data");
    case InvalidPriority:
        if (message.isEmpty()) {
            return QStringLiteral("priority must be a single letter A-Z");
        }
        return QStringLiteral("invalid priority '%1': must be a single letter A-Z").arg(message);
    case Io:
    default:
        if (message.isEmpty()) {
            return QStringLiteral("I/O error");
        }
        return message;
    }
}

void reportError(TodoError *error, TodoError::Code code, QString message)
{
    if (!error) {
        return;
    }
    error->code = code;
    error->message = std::move(message);
}

} // namespace data
} // namespace todotxt
