#include "todotxt/data/InMemoryTaskStorage.hpp"

#include <utility>

namespace todotxt {
namespace data {

InMemoryTaskStorage::InMemoryTaskStorage(QStringList lines, QString location)
    : m_lines(std::move(lines))
    , m_location(std::move(location))
{
}

InMemoryTaskStorage::~InMemoryTaskStorage() = default;

QString InMemoryTaskStorage::location() const
{
    return m_location;
}

bool InMemoryTaskStorage::readLine(QString &line)
{
    if (m_failReadAt >= 0 && m_nextLine >= m_failReadAt) {
        m_errorString = m_readFailure;
        return false;
    }
    if (m_nextLine >= m_lines.size()) {
        return false;
    }
    line = m_lines.at(m_nextLine++);
    return true;
}

QString InMemoryTaskStorage::errorString() const
{
    return m_errorString;
}

bool InMemoryTaskStorage::overwrite(const QString &contents, QString *errorString)
{
    if (!m_writeFailure.isEmpty()) {
        if (errorString) {
            *errorString = m_writeFailure;
        }
        return false;
    }
    m_contents = contents;
    ++m_writeCount;
    return true;
}

const QString &InMemoryTaskStorage::contents() const
{
    return m_contents;
}

int InMemoryTaskStorage::writeCount() const
{
    return m_writeCount;
}

void InMemoryTaskStorage::failReadsAfter(int afterLines, QString message)
{
    m_failReadAt = afterLines;
    m_readFailure = std::move(message);
}

void InMemoryTaskStorage::failWrites(QString message)
{
    m_writeFailure = std::move(message);
}

} // namespace data
} // namespace todotxt
