#pragma once

#include <QString>

namespace todotxt {
namespace data {

class LineSource
{
public:
    virtual ~LineSource() = default;

    virtual QString location() const = 0;
    // Returns false at end of input and on failure; errorString() tells
    // the two apart.
    virtual bool readLine(QString &line) = 0;
    virtual QString errorString() const = 0;
};

} // namespace data
} // namespace todotxt
